#include "comparison_engine.hpp"
#include "result_reporter.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

ComparisonEngine::ComparisonEngine(ResultReporter *reporter, DigestFunction digest)
    : reporter_(reporter), digest_(std::move(digest))
{
    if (!digest_)
    {
        throw std::invalid_argument("ComparisonEngine requires a digest function");
    }
}

ComparisonOutcome ComparisonEngine::run(const RunConfiguration &config)
{
    if (config.algorithms.empty())
    {
        throw std::invalid_argument("No algorithms to compare");
    }
    if (config.files.empty())
    {
        throw std::invalid_argument("No files to compare");
    }

    entries_.clear();
    entries_.reserve(config.files.size());
    for (const auto &path : config.files)
    {
        entries_.push_back(FileEntry{path, {}});
    }

    ComparisonOutcome outcome;
    outcome.expectedValue = config.expectedDigest;

    // Header goes above the first row of this run only
    bool headerPending = true;

    // One hash column wide enough for every algorithm of the run
    size_t hashWidth = 0;
    for (Checksum::Algorithm algorithm : config.algorithms)
    {
        hashWidth = std::max(hashWidth, Checksum::digestLength(algorithm));
    }

    for (Checksum::Algorithm algorithm : config.algorithms)
    {
        outcome.algorithmStoppedAt = algorithm;

        for (auto &entry : entries_)
        {
            entry.digests[algorithm] = digest_(entry.path, algorithm);

            if (!config.quiet && reporter_)
            {
                reporter_->printDigestRow(entry, algorithm, headerPending, hashWidth);
                headerPending = false;
            }
        }

        outcome.matched = allMatch(config, algorithm);
        if (!outcome.matched || config.fast)
        {
            break;
        }
    }

    return outcome;
}

bool ComparisonEngine::allMatch(const RunConfiguration &config, Checksum::Algorithm algorithm) const
{
    // Against the expected digest every file counts; otherwise the first
    // file is the reference for the rest.
    auto begin = entries_.begin();
    std::string source;
    if (config.expectedDigest)
    {
        source = *config.expectedDigest;
    }
    else
    {
        source = begin->digests.at(algorithm);
        ++begin;
    }

    bool matched = true;
    for (auto it = begin; it != entries_.end(); ++it)
    {
        // No early exit: every comparison is made
        if (!Checksum::digestsEqual(it->digests.at(algorithm), source))
        {
            matched = false;
        }
    }
    return matched;
}
