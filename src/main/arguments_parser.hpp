#pragma once
#include "launch_settings.hpp"

#include <string>

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating
 * launch settings.
 */
class ArgumentsParser {
public:
  /**
   * @brief Parses the command-line arguments and generates launch settings.
   *
   * Options come first; the remaining arguments are the explicit file set.
   * Values may be given as "--option value" or "--option=value".
   * @param argc The number of command-line arguments.
   * @param argv The array of command-line arguments.
   * @return The generated launch settings.
   * @throws errors::ConfigurationError for a missing or malformed value.
   */
  LaunchSettings Parse(int argc, char **argv);

private:
  /**
   * @brief Takes the value of the current option and advances past it.
   */
  std::string TakeValue(int &argc, char **&argv, const std::string &option,
                        const std::string &inline_value, bool has_inline);

  static int ToInt(const std::string &option, const std::string &value);
  static double ToDouble(const std::string &option, const std::string &value);
};
