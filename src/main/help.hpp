#pragma once

/**
 * @brief Prints command-line usage to stdout.
 */
void PrintHelp();

/**
 * @brief Prints the version line to stdout.
 */
void PrintVersion();
