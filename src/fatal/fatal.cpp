#include "fatal.hpp"
#include "../utils/verbose/verbose.hpp"
#include <fmt/core.h>
#include <iostream>
#include <mutex>

namespace loger {
namespace {
static constexpr std::string_view kTool = "ctestgen";

std::mutex output_mutex;

void emit(std::ostream &out, const std::string &line) {
  std::lock_guard<std::mutex> lock(output_mutex);
  out << line << std::endl;
}
} // namespace

void info(const std::string_view &s1) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrintVerbose()) {
    return;
  }
  emit(std::cout, fmt::format("{}: {}", kTool, s1));
}

void notice(const std::string_view &s1) {
  emit(std::cout, fmt::format("{}: {}", kTool, s1));
}

void warning(const std::string_view &s1, const std::optional<std::string> &s2) {
  emit(std::cout,
       fmt::format("{}: Warning: {}{}", kTool, s1, s2.value_or("")));
}

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  emit(std::cerr, fmt::format("{}: Error: {}{}", kTool, s1, s2.value_or("")));
}

} // namespace loger
