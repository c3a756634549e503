#ifndef EXTMGR_UTILS_LOGGING_HPP
#define EXTMGR_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace extmgr {
namespace utils {

/**
 * @brief Logging configuration, usually read from the "logging" block of the
 * manager configuration file.
 */
struct LoggingConfig {
    std::string level{"info"};                          // trace, debug, info, warn, error, critical, off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    std::string file;                                   // Optional log file, empty for stderr only
};

/**
 * @brief Returns the library logger, creating it on first use.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Rebuilds the library logger from the given configuration.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void configure_logging(const LoggingConfig& config);

} // namespace utils
} // namespace extmgr

#define EMLOG_DEBUG(message)    ::extmgr::utils::logger()->debug(message)
#define EMLOG_INFO(message)     ::extmgr::utils::logger()->info(message)
#define EMLOG_WARN(message)     ::extmgr::utils::logger()->warn(message)
#define EMLOG_ERROR(message)    ::extmgr::utils::logger()->error(message)
#define EMLOG_CRITICAL(message) ::extmgr::utils::logger()->critical(message)

#endif // EXTMGR_UTILS_LOGGING_HPP
