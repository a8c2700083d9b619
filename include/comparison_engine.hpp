#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <filesystem>

#include "checksum.hpp"
#include "config.hpp"

class ResultReporter;

/**
 * One input file and the digests computed for it so far.
 * An algorithm missing from the map was never computed.
 */
struct FileEntry
{
    std::filesystem::path path;
    std::map<Checksum::Algorithm, std::string> digests;
};

/**
 * Result of one comparison run.
 */
struct ComparisonOutcome
{
    bool matched = false;
    Checksum::Algorithm algorithmStoppedAt = Checksum::Algorithm::SHA512;
    std::optional<std::string> expectedValue;
};

/**
 * Hashes files algorithm by algorithm and compares the results.
 *
 * For each algorithm every file is hashed before the comparison is decided,
 * so a printed table always holds complete passes. The run stops at the
 * first algorithm that mismatches, or at the first match in fast mode.
 */
class ComparisonEngine
{
public:
    /**
     * Digest source: (path, algorithm) → hex digest.
     * Must throw HashComputationError when the file cannot be read.
     */
    using DigestFunction = std::function<std::string(const std::filesystem::path &, Checksum::Algorithm)>;

    /**
     * @param reporter Receives per-file digest rows; may be null
     * @param digest Digest source, OpenSSL-backed by default
     */
    explicit ComparisonEngine(ResultReporter *reporter = nullptr,
                              DigestFunction digest = &Checksum::computeDigest);

    /**
     * Run the comparison described by a validated configuration.
     *
     * @param config Output of InputValidator::validate
     * @return Verdict and the algorithm the run stopped at
     * @throws HashComputationError if any file cannot be hashed; no verdict
     *         is produced in that case
     */
    ComparisonOutcome run(const RunConfiguration &config);

    /**
     * Files and digests of the latest run.
     */
    const std::vector<FileEntry> &entries() const { return entries_; }

private:
    bool allMatch(const RunConfiguration &config, Checksum::Algorithm algorithm) const;

    ResultReporter *reporter_;
    DigestFunction digest_;
    std::vector<FileEntry> entries_;
};
