/**
 * @file logging.cpp
 * @brief leatherman.logging configuration
 */

#include "atlex/logging.hpp"

#define LEATHERMAN_LOGGING_NAMESPACE "atlex.logging"
#include <leatherman/logging/logging.hpp>

#include <map>

namespace atlex::util {

namespace lth_log = leatherman::logging;

VoidResult setup_logging(std::ostream& stream, const std::string& level_label)
{
    static const std::map<std::string, lth_log::log_level> kLabelToLevel{
        {   "none",    lth_log::log_level::none},
        {  "trace",   lth_log::log_level::trace},
        {  "debug",   lth_log::log_level::debug},
        {   "info",    lth_log::log_level::info},
        {"warning", lth_log::log_level::warning},
        {  "error",   lth_log::log_level::error},
        {  "fatal",   lth_log::log_level::fatal}
    };

    auto it = kLabelToLevel.find(level_label);
    if (it == kLabelToLevel.end()) {
        return std::unexpected(
            Error::make("InvalidLogLevel", "Unknown log level: '" + level_label + "'"));
    }
    setup_logging(stream, it->second);
    return {};
}

void setup_logging(std::ostream& stream, lth_log::log_level level)
{
    lth_log::setup_logging(stream);
    lth_log::set_level(level);
    LOG_DEBUG("atlex logging initialized");
}

}  // namespace atlex::util
