#include "cli.hpp"
#include "checksum.hpp"
#include "algorithm_resolver.hpp"

void defineArguments(CLI::App &app, CompareRequest &request)
{
    // Positional: files to compare (count is checked by the validator)
    app.add_option("FILES", request.files,
                   "Files to compare (at least two, or one with --expected)");

    // Optional: algorithms, repeatable and comma-separated
    // --algorithms and --algorithm are both accepted
    app.add_option("-a,--algorithm,--algorithms", request.algorithms,
                   "Hash algorithms: MD5, SHA1, SHA256, SHA384, SHA512 or All (default: SHA512)")
        ->expected(1)
        ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
        ->delimiter(',')
        ->check([](const std::string &name) -> std::string {
            if (AlgorithmResolver::isAll(name)) {
                return "";
            }
            try {
                Checksum::parseAlgorithm(name);
                return ""; // Valid
            } catch (const std::exception &e) {
                return e.what();
            }
        });

    // Optional: expected digest, algorithm inferred from its length
    app.add_option("-e,--expected,--hash", request.expectedHash,
                   "Expected hash; the algorithm is inferred from its length");

    // Flags (--quick is the older name of --fast)
    app.add_flag("-q,--quiet", request.quiet, "Only print the verdict");
    app.add_flag("-f,--fast,--quick", request.fast, "Stop after the first algorithm that matches");
    app.add_flag("--no-color", request.noColor, "Disable colored output");

    // Optional flag: --version (for help display only, actual handling is done in main)
    app.add_flag("-v,--version", request.showVersion, "Display version information");
}
