#include "trimerge/Cli.hpp"
#include "trimerge/Logging.hpp"

#include <iostream>

INITIALIZE_EASYLOGGINGPP

int main(int argc, char** argv) {
    trimerge::configure_logging("warning");
    std::vector<std::string> args(argv, argv + argc);
    return trimerge::run_cli(args, std::cout, std::cerr);
}
