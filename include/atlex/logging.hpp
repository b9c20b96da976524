#pragma once

/**
 * @file logging.hpp
 * @brief Logging setup for the atlex library
 *
 * atlex logs through leatherman.logging; every translation unit defines its
 * own LEATHERMAN_LOGGING_NAMESPACE ("atlex.<module>") before including
 * <leatherman/logging/logging.hpp>. When Boost.Log is statically linked the
 * sink must be configured from within the library, hence this entry point.
 */

#include "atlex/common.hpp"

#include <ostream>
#include <string>

// Forward declaration for leatherman::logging::log_level
namespace leatherman {
namespace logging {
enum class log_level;
}  // namespace logging
}  // namespace leatherman

namespace atlex::util {

/**
 * Route library logs to a stream at the given level.
 * @param stream Sink stream
 * @param level_label One of none, trace, debug, info, warning, error, fatal
 * @return InvalidLogLevel for an unknown label
 */
[[nodiscard]] VoidResult setup_logging(std::ostream& stream, const std::string& level_label);

void setup_logging(std::ostream& stream, leatherman::logging::log_level level);

}  // namespace atlex::util
