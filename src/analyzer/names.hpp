#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace analyzer {

/**
 * @brief Classes of reserved C words.
 */
enum class NameKind {
  kType,      ///< int, char, struct, ...
  kQualifier, ///< const, volatile, restrict
  kStorage,   ///< static, extern, inline, ...
  kControl,   ///< if, for, while, ...
  kOther      ///< sizeof, typedef, ...
};

/**
 * @brief Classifies a reserved word.
 * @param value The identifier to look up.
 * @return The kind of the keyword, or std::nullopt for ordinary identifiers.
 */
std::optional<NameKind> ParseNameToken(std::string_view value);

inline bool IsKeyword(std::string_view value) {
  return ParseNameToken(value).has_value();
}

bool IsTypeKeyword(std::string_view value);

/**
 * @brief Checks whether a name belongs to the C standard library (or the
 * Unity harness). Such names are never stubbed.
 */
bool IsStandardLibraryFunction(std::string_view value);

/**
 * @brief Checks whether a name is a scalar type a stub can return as 0.
 * @param type Normalized type text, e.g. "unsigned long".
 */
bool IsScalarType(const std::string &type);

} // namespace analyzer
