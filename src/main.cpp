#include <cstdio>
#include <unistd.h>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "cli.hpp"
#include "config.hpp"
#include "checksum.hpp"
#include "validator.hpp"
#include "comparison_engine.hpp"
#include "result_reporter.hpp"

namespace
{
    // Process exit codes
    constexpr int EXIT_MATCH = 0;
    constexpr int EXIT_MISMATCH = 1;
    constexpr int EXIT_ERROR = 2;
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v") {
            fmt::print("hashcmp v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - OpenSSL: MD5, SHA-1 and SHA-2 digests\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return EXIT_MATCH;
        }
    }

    // Create CLI11 app
    CLI::App app{"hashcmp v1.0 - Compare file digests with each other or with an expected hash"};

    // Request struct to be populated
    CompareRequest request;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    defineArguments(app, request);

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // Color only on a terminal
    const bool useColor = !request.noColor && ::isatty(fileno(stdout));
    ResultReporter reporter(stdout, stderr, useColor);

    // ====================================================================
    // VALIDATE AND COMPARE
    // ====================================================================

    try
    {
        RunConfiguration config = InputValidator::validate(request);

        ComparisonEngine engine(&reporter);
        ComparisonOutcome outcome = engine.run(config);

        reporter.printVerdict(outcome);
        return outcome.matched ? EXIT_MATCH : EXIT_MISMATCH;
    }
    catch (const ValidationError &e)
    {
        reporter.printIssues(e);
        return EXIT_ERROR;
    }
    catch (const HashComputationError &e)
    {
        reporter.printError(fmt::format("Hashing failed: {}", e.what()));
        return EXIT_ERROR;
    }
    catch (const std::exception &e)
    {
        reporter.printError(fmt::format("Fatal error: {}", e.what()));
        return EXIT_ERROR;
    }
}
