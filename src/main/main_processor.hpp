#pragma once

#include "launch_settings.hpp"

#include <atomic>

/**
 * @brief Class representing the main processor of the program.
 */
class MainProcessor {
public:
  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program: 0 when every target was
   * accepted, 1 otherwise.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Runs the pipeline for already parsed settings.
   */
  int Process(const LaunchSettings &settings);

  /**
   * @brief Set by SIGINT; workers stop after their current step.
   */
  static std::atomic<bool> &AbortFlag();

private:
  static void InstallSignalHandler();
};
