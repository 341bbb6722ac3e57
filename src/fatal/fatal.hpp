#ifndef FATAL_CTESTGEN_H
#define FATAL_CTESTGEN_H

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for progress and error
 * reporting.
 *
 * All functions are safe to call from pipeline workers; output lines are
 * never interleaved.
 */
namespace loger {

/**
 * @brief Logs a progress message. Printed only in verbose mode.
 * @param s1 The message.
 */
void info(const std::string_view &s1);

/**
 * @brief Logs a progress message regardless of verbosity.
 * @param s1 The message.
 */
void notice(const std::string_view &s1);

/**
 * @brief Logs a warning with an optional additional message.
 * @param s1 The main warning message.
 * @param s2 Optional additional message.
 */
void warning(const std::string_view &s1,
             const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

} // namespace loger

#endif
