#pragma once

#include <string>
#include <vector>
#include <optional> // C++17 feature for optional values
#include <filesystem>

#include "checksum.hpp"

/**
 * Raw comparison request.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct CompareRequest
{
    // Files to hash, in the order given
    std::vector<std::string> files;

    // Algorithm names as typed; entries may be comma lists or "All".
    // Empty means the default (SHA512).
    std::vector<std::string> algorithms;

    // Compare every file against this digest instead of against each other
    std::optional<std::string> expectedHash;

    // Flags
    bool quiet = false;       // Suppress per-file digest rows
    bool fast = false;        // Stop after the first algorithm that matches
    bool noColor = false;     // Disable colored verdict
    bool showVersion = false; // Display version and exit
};

/**
 * Validated settings for one comparison run.
 * Produced by InputValidator; never modified afterwards.
 */
struct RunConfiguration
{
    std::vector<std::filesystem::path> files;
    std::vector<Checksum::Algorithm> algorithms; // Exactly one in expected-mode
    std::optional<std::string> expectedDigest;
    bool quiet = false;
    bool fast = false;
};
