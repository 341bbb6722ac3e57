#include "help.hpp"

#include "../version/version.hpp"

#include <iostream>

void PrintHelp() {
  std::cout
      << "use: ctestgen [options] [file.c ...]\n"
      << "\tgenerate and validate Unity tests for the functions of a C "
         "codebase\n\n"
      << "\t--repo-path P  repository root (default .)\n"
      << "\t--source-dir D  directory scanned for .c/.h files, relative to "
         "the repository (default src)\n"
      << "\t--output D  output directory (default tests)\n"
      << "\t--function N  only generate for function N (repeatable)\n"
      << "\t--quality-threshold T  high, medium or low (default high)\n"
      << "\t--regenerate-on-low-quality  retry with feedback below the "
         "threshold\n"
      << "\t--max-regeneration-attempts N  retries after the first attempt "
         "(default 2)\n"
      << "\t--provider-cmd C  generation command, prompt on stdin "
         "(default $CTESTGEN_PROVIDER_CMD)\n"
      << "\t--provider-timeout S  seconds per generation call (default 120)\n"
      << "\t--compiler C  C compiler (default gcc)\n"
      << "\t--compile-timeout S  seconds per compilation (default 60)\n"
      << "\t--unity-dir D  Unity headers (default <repo>/unity/src)\n"
      << "\t-I D  extra include directory (repeatable)\n"
      << "\t--stub-return N=E  value returned by the stub of N\n"
      << "\t--pointer-sentinel E  default return of pointer stubs "
         "(default NULL)\n"
      << "\t--min-assertions N  minimum assertions per test (default 1)\n"
      << "\t--comprehensive-ratio R  assertion density for high quality "
         "(default 1.0)\n"
      << "\t--jobs N  parallel targets (default: number of cores)\n"
      << "\t--redact-sensitive  redact comments, strings and secrets in "
         "prompts\n"
      << "\t--rate-limit-backoff MS  backoff unit after rate limiting "
         "(default 1000)\n"
      << "\t-v, --verbose  print progress\n"
      << "\t--print-prompts  print every prompt\n"
      << "\t--print-diagnostics  print compiler output\n"
      << "\t-V, --version  print version and stop\n"
      << "\t-h, --help  print this help and stop\n";
}

void PrintVersion() { std::cout << CTESTGEN_VERSION << std::endl; }
