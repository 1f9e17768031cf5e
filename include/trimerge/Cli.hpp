/**
 * @file Cli.hpp
 * @brief Command-line front end
 *
 * Usage: trimerge [options] BASE LOCAL REMOTE
 *
 * Exit codes:
 * - 0: merged without conflicts
 * - 1: merged with conflicts
 * - 2: error (bad arguments, unreadable input, merge failure)
 */

#ifndef TRIMERGE_CLI_HPP
#define TRIMERGE_CLI_HPP

#include <ostream>
#include <string>
#include <vector>

namespace trimerge {

/**
 * @brief Run the command line
 *
 * @param args Arguments including the program name
 * @param out Decision output (unless --out is given)
 * @param err Diagnostics
 * @return Process exit code
 */
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace trimerge

#endif // TRIMERGE_CLI_HPP
