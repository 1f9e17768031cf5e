/**
 * @file Logging.cpp
 * @brief easylogging++ configuration
 */

#include "trimerge/Logging.hpp"
#include "trimerge/Util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace trimerge {

namespace {

/**
 * @brief Sends formatted log lines to stderr
 *
 * stdout is reserved for merge output.
 */
class StderrDispatcher : public el::LogDispatchCallback {
protected:
    void handle(const el::LogDispatchData* data) override {
        const el::LogMessage* msg = data->logMessage();
        std::cerr << msg->logger()->logBuilder()->build(
            msg, data->dispatchAction() == el::base::DispatchAction::NormalLog);
    }
};

} // anonymous namespace

void configure_logging(const std::string& level) {
    static const std::vector<std::pair<std::string, el::Level>> ordered = {
        {"trace", el::Level::Trace},
        {"debug", el::Level::Debug},
        {"info", el::Level::Info},
        {"warning", el::Level::Warning},
        {"error", el::Level::Error},
        {"fatal", el::Level::Fatal},
    };

    const std::string wanted = to_lower(level);
    std::size_t threshold = ordered.size();
    if (wanted != "off") {
        threshold = 0;
        while (threshold < ordered.size() && ordered[threshold].first != wanted) {
            ++threshold;
        }
        if (threshold == ordered.size()) {
            throw std::invalid_argument("unknown log level '" + level + "'");
        }
    }

    el::Configurations conf;
    conf.setToDefault();
    conf.setGlobally(el::ConfigurationType::ToFile, "false");
    conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
    conf.setGlobally(el::ConfigurationType::Format, "%datetime %level [trimerge] %msg");
    conf.set(el::Level::Verbose, el::ConfigurationType::Enabled, "false");
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        conf.set(ordered[i].second, el::ConfigurationType::Enabled, i >= threshold ? "true" : "false");
    }
    el::Loggers::reconfigureLogger("default", conf);
    el::Helpers::installLogDispatchCallback<StderrDispatcher>("TrimergeStderr");
}

} // namespace trimerge
