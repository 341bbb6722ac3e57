#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace orchestrator {

/**
 * @brief Replaces potentially sensitive content of source text with markers
 * before it leaves the machine.
 *
 * Covers comments, string literals, credential-like tokens, e-mail
 * addresses, URLs and IPv4 addresses.
 */
class Redactor {
public:
  Redactor();

  std::string Redact(const std::string &text) const;

private:
  std::vector<std::pair<std::regex, std::string>> patterns_;
};

} // namespace orchestrator
