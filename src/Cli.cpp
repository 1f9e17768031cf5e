#include "trimerge/Cli.hpp"
#include "trimerge/Errors.hpp"
#include "trimerge/Loader.hpp"
#include "trimerge/Logging.hpp"
#include "trimerge/Merge.hpp"
#include "trimerge/Settings.hpp"
#include "trimerge/Util.hpp"

#include <cxxopts.hpp>
#include <algorithm>
#include <fstream>

namespace trimerge {

namespace {

constexpr int kExitClean = 0;
constexpr int kExitConflicts = 1;
constexpr int kExitError = 2;

void write_summary(std::ostream& os, const Decisions& decisions, std::size_t total,
                   std::size_t conflicts) {
    for (const auto& d : decisions) {
        os << (d.conflict ? "CONFLICT " : "         ") << to_string(d.action) << " "
           << (d.path.empty() ? "/" : d.path) << " " << format_key(d.key) << "\n";
    }
    os << total << " decisions, " << conflicts << " conflicts\n";
}

} // anonymous namespace

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("trimerge", "Three-way merge of JSON documents into merge decisions");
        options.positional_help("BASE LOCAL REMOTE");

        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("o,out", "Write decisions to FILE instead of stdout", cxxopts::value<std::string>())
            ("max-depth", "Maximum document nesting depth", cxxopts::value<int>())
            ("log-level", "trace|debug|info|warning|error|fatal|off", cxxopts::value<std::string>())
            ("indent", "JSON indentation (-1 for compact)", cxxopts::value<int>())
            ("set", "Comma-separated key=value setting overrides", cxxopts::value<std::string>()->default_value(""))
            ("conflicts-only", "Only output conflicting decisions")
            ("summary", "Print a line per decision instead of JSON")
            ("h,help", "Show help");

        options.add_options()
            ("documents", "BASE LOCAL REMOTE", cxxopts::value<std::vector<std::string>>());
        options.parse_positional({"documents"});

        std::vector<const char*> argv;
        argv.reserve(args.size());
        for (const auto& a : args) argv.push_back(a.c_str());
        auto result = options.parse(static_cast<int>(argv.size()), argv.data());

        if (result.count("help")) {
            out << options.help() << "\n";
            return kExitClean;
        }

        std::vector<std::string> documents;
        if (result.count("documents")) {
            documents = result["documents"].as<std::vector<std::string>>();
        }
        if (documents.size() != 3) {
            err << "Error: expected BASE LOCAL REMOTE, got " << documents.size() << " documents\n";
            return kExitError;
        }

        SettingsSources sources;
        if (result.count("config")) sources.file_path = result["config"].as<std::string>();
        sources.overrides = parse_overrides(result["set"].as<std::string>());
        if (result.count("max-depth")) sources.overrides["merge.max_depth"] = result["max-depth"].as<int>();
        if (result.count("log-level")) sources.overrides["log.level"] = result["log-level"].as<std::string>();
        if (result.count("indent")) sources.overrides["output.indent"] = result["indent"].as<int>();

        const Settings settings = Settings::load(sources);
        configure_logging(settings.log_level());

        const Value base = load_json_file(documents[0]);
        const Value local = load_json_file(documents[1]);
        const Value remote = load_json_file(documents[2]);

        Decisions decisions = merge(base, local, remote, settings.merge_options(),
                                    settings.differ_options());
        const std::size_t total = decisions.size();
        const std::size_t conflicts = count_conflicts(decisions);
        LOG(INFO) << documents[0] << ": " << total << " decisions, " << conflicts << " conflicts";

        if (result.count("conflicts-only")) {
            decisions.erase(std::remove_if(decisions.begin(), decisions.end(),
                                           [](const MergeDecision& d) { return !d.conflict; }),
                            decisions.end());
        }

        std::ofstream file;
        if (result.count("out")) {
            const std::string path = result["out"].as<std::string>();
            file.open(path);
            if (!file) {
                err << "Error: cannot write to " << path << "\n";
                return kExitError;
            }
        }
        std::ostream& sink = file.is_open() ? static_cast<std::ostream&>(file) : out;

        if (result.count("summary")) {
            write_summary(sink, decisions, total, conflicts);
        } else {
            sink << decisions_to_json(decisions).dump(settings.indent()) << "\n";
        }

        return conflicts > 0 ? kExitConflicts : kExitClean;

    } catch (const MergeError& ex) {
        LOG(ERROR) << ex.what();
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace trimerge
