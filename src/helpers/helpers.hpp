#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Namespace containing helper functions for character and string
 * manipulation.
 */
namespace helpers {

/**
 * @brief Checks if the given character is a digit.
 * @param curr The character to check.
 * @return Non-zero if the character is a digit.
 */
int isdigit_(int curr);

/**
 * @brief Checks if the given character may start a C identifier.
 * @param curr The character to check.
 * @return Non-zero for letters and underscore.
 */
int isalpha_(int curr);

/**
 * @brief Checks if the given character may continue a C identifier.
 * @param curr The character to check.
 * @return Non-zero for letters, digits and underscore.
 */
int isalnum_(int curr);

/**
 * @brief Checks if the given character is a whitespace character.
 * @param curr The character to check.
 * @return `true` if the character is a whitespace character, `false` otherwise.
 */
bool IsWhitespace(int curr);

/**
 * @brief Skips over leading blanks and tabs.
 * @param p The input string.
 * @return The rest of the string, possibly empty.
 */
std::string SkipWhite(const std::string &p);

/**
 * @brief Removes leading and trailing whitespace.
 */
std::string Trim(const std::string &p);

/**
 * @brief Replaces every whitespace run with a single blank and trims.
 */
std::string CollapseWhitespace(const std::string &p);

bool StartsWith(std::string_view value, std::string_view prefix);

bool EndsWith(std::string_view value, std::string_view suffix);

std::string ToLower(std::string value);

/**
 * @brief Splits text into lines, dropping the line terminators.
 * @param text The text to split.
 * @return The lines; a trailing newline does not produce an empty last line.
 */
std::vector<std::string> SplitLines(const std::string &text);

/**
 * @brief Reads a whole file.
 * @param path The file to read.
 * @return The file content, or std::nullopt if it cannot be opened.
 */
std::optional<std::string> ReadFile(const std::string &path);

} // namespace helpers
