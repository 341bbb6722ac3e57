#include "arguments_parser.hpp"

#include "../errors/errors.hpp"
#include "../utils/verbose/verbose.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <stdexcept>
#include <thread>

std::string ArgumentsParser::TakeValue(int &argc, char **&argv,
                                       const std::string &option,
                                       const std::string &inline_value,
                                       bool has_inline) {
  if (has_inline) {
    return inline_value;
  }
  if (argc < 3) {
    throw errors::ConfigurationError(
        fmt::format("option {} needs a value", option));
  }
  argc--;
  argv++;
  return argv[1];
}

int ArgumentsParser::ToInt(const std::string &option, const std::string &value) {
  try {
    std::size_t used = 0;
    int result = std::stoi(value, &used);
    if (used == value.size()) {
      return result;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw errors::ConfigurationError(
      fmt::format("option {} expects an integer, got '{}'", option, value));
}

double ArgumentsParser::ToDouble(const std::string &option,
                                 const std::string &value) {
  try {
    std::size_t used = 0;
    double result = std::stod(value, &used);
    if (used == value.size()) {
      return result;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw errors::ConfigurationError(
      fmt::format("option {} expects a number, got '{}'", option, value));
}

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();

  if (const char *command = std::getenv("CTESTGEN_PROVIDER_CMD")) {
    result.provider_cmd = command;
  }
  unsigned cores = std::thread::hardware_concurrency();
  result.jobs = cores == 0 ? 1 : static_cast<int>(cores);

  while (argc > 1 && argv[1][0] == '-' && argv[1][1] != '\0') {
    std::string arg(argv[1]);
    switch (argv[1][1]) {
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    case 'v': {
      verbose_flags.SetNeedToPrintVerbose();
      break;
    }
    case 'I': {
      result.include_dirs.push_back(
          TakeValue(argc, argv, "-I", arg.substr(2), arg.size() > 2));
      break;
    }
    case '-': {
      if (arg == "--") {
        argc--;
        argv++;
        goto files;
      }
      auto equals = arg.find('=');
      std::string option = arg.substr(0, equals);
      bool has_inline = equals != std::string::npos;
      std::string inline_value = has_inline ? arg.substr(equals + 1) : "";
      auto value = [&]() {
        return TakeValue(argc, argv, option, inline_value, has_inline);
      };

      if (option == "--help") {
        result.need_to_print_help_and_stop = true;
      } else if (option == "--version") {
        result.need_to_print_version_and_stop = true;
      } else if (option == "--verbose") {
        verbose_flags.SetNeedToPrintVerbose();
      } else if (option == "--print-prompts") {
        verbose_flags.SetNeedToPrintPrompts();
      } else if (option == "--print-diagnostics") {
        verbose_flags.SetNeedToPrintDiagnostics();
      } else if (option == "--repo-path") {
        result.repo_path = value();
      } else if (option == "--source-dir") {
        result.source_dir = value();
      } else if (option == "--output") {
        result.output_dir = value();
      } else if (option == "--function") {
        result.functions.push_back(value());
      } else if (option == "--quality-threshold") {
        auto text = value();
        auto tier = models::ParseQualityTier(text);
        if (!tier.has_value()) {
          throw errors::ConfigurationError(fmt::format(
              "--quality-threshold must be high, medium or low, got '{}'",
              text));
        }
        result.quality_threshold = *tier;
      } else if (option == "--regenerate-on-low-quality") {
        result.regenerate_on_low_quality = true;
      } else if (option == "--max-regeneration-attempts") {
        result.max_regeneration_attempts = ToInt(option, value());
      } else if (option == "--provider-cmd") {
        result.provider_cmd = value();
      } else if (option == "--provider-timeout") {
        result.provider_timeout = ToInt(option, value());
      } else if (option == "--compiler") {
        result.compiler = value();
      } else if (option == "--compile-timeout") {
        result.compile_timeout = ToInt(option, value());
      } else if (option == "--unity-dir") {
        result.unity_dir = value();
      } else if (option == "--stub-return") {
        auto text = value();
        auto split = text.find('=');
        if (split == std::string::npos || split == 0 ||
            split + 1 == text.size()) {
          throw errors::ConfigurationError(fmt::format(
              "--stub-return expects NAME=EXPRESSION, got '{}'", text));
        }
        result.stub_returns[text.substr(0, split)] = text.substr(split + 1);
      } else if (option == "--pointer-sentinel") {
        result.pointer_sentinel = value();
      } else if (option == "--min-assertions") {
        result.min_assertions = ToInt(option, value());
      } else if (option == "--comprehensive-ratio") {
        result.comprehensive_ratio = ToDouble(option, value());
      } else if (option == "--jobs") {
        result.jobs = ToInt(option, value());
      } else if (option == "--redact-sensitive") {
        result.redact_sensitive = true;
      } else if (option == "--rate-limit-backoff") {
        result.rate_limit_backoff_ms = ToInt(option, value());
      } else {
        result.unknown_option = arg;
        result.need_to_print_help_and_stop = true;
      }
      break;
    }
    default: {
      result.unknown_option = arg;
      result.need_to_print_help_and_stop = true;
      break;
    }
    }
    argc--;
    argv++;
  }

files:
  for (int i = 1; i < argc; i++) {
    result.files.push_back(argv[i]);
  }
  return result;
}
