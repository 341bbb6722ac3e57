#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing pipeline progress.
 *
 * Flags are set once by the argument parser before any worker starts and are
 * only read afterwards.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags();

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to print verbose progress is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Check if the flag to print every generation prompt is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintPrompts() const;

  /**
   * @brief Check if the flag to print compiler diagnostics is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintDiagnostics() const;

  /**
   * @brief Reset every flag to its default.
   */
  void Reset();

  void SetNeedToPrintVerbose();
  void SetNeedToPrintPrompts();
  void SetNeedToPrintDiagnostics();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_;
  bool need_to_print_prompts_;
  bool need_to_print_diagnostics_;
};

} // namespace utils::verbose
