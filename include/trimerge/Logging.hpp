/**
 * @file Logging.hpp
 * @brief easylogging++ setup
 *
 * Library code logs through the default easylogging++ logger
 * (LOG(DEBUG), LOG(INFO), ...). Every executable linking trimerge must
 * expand INITIALIZE_EASYLOGGINGPP once.
 */

#ifndef TRIMERGE_LOGGING_HPP
#define TRIMERGE_LOGGING_HPP

#include <easylogging++.h>
#include <string>

namespace trimerge {

/**
 * @brief Enable log levels at or above @p level
 *
 * @param level One of "trace", "debug", "info", "warning", "error",
 *              "fatal" (case-insensitive), or "off"
 * @throws std::invalid_argument for unknown levels
 */
void configure_logging(const std::string& level);

} // namespace trimerge

#endif // TRIMERGE_LOGGING_HPP
