#pragma once

#include <CLI/CLI.hpp> // CLI11 main header

#include "config.hpp"

/**
 * Register hashcmp's positional argument, options and flags on a CLI11 app.
 *
 * Each -a/--algorithm takes exactly one value (itself a comma list), so
 * "hashcmp -a MD5 a.txt b.txt" leaves both paths to FILES. Repeated -a
 * options accumulate.
 *
 * @param app CLI11 app to configure
 * @param request Struct populated when app.parse() runs; must outlive app
 */
void defineArguments(CLI::App &app, CompareRequest &request);
