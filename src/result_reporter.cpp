#include "result_reporter.hpp"
#include "validator.hpp"
#include <fmt/core.h>
#include <fmt/color.h>

namespace
{
    constexpr size_t ALGORITHM_WIDTH = 9; // strlen("Algorithm")
}

ResultReporter::ResultReporter(std::FILE *out, std::FILE *err, bool useColor)
    : out_(out), err_(err), useColor_(useColor)
{
}

void ResultReporter::printDigestRow(const FileEntry &entry, Checksum::Algorithm algorithm, bool withHeader,
                                    size_t hashWidth)
{
    if (hashWidth == 0)
    {
        hashWidth = Checksum::digestLength(algorithm);
    }

    if (withHeader)
    {
        fmt::print(out_, "{}", formatRow("Algorithm", "Hash", "Path", hashWidth));
        fmt::print(out_, "{}", formatRow("---------", "----", "----", hashWidth));
    }

    auto it = entry.digests.find(algorithm);
    const std::string hash = it != entry.digests.end() ? it->second : std::string();
    fmt::print(out_, "{}", formatRow(Checksum::algorithmName(algorithm), hash, entry.path.string(), hashWidth));
}

void ResultReporter::printVerdict(const ComparisonOutcome &outcome)
{
    const std::string text = verdict(outcome);

    if (useColor_)
    {
        const auto color = outcome.matched ? fmt::color::green : fmt::color::red;
        fmt::print(out_, fmt::fg(color) | fmt::emphasis::bold, "{}", text);
        fmt::print(out_, "\n");
    }
    else
    {
        fmt::print(out_, "{}\n", text);
    }
    std::fflush(out_);
}

void ResultReporter::printIssues(const ValidationError &error)
{
    for (const auto &issue : error.issues())
    {
        printError(issue.message);
    }
}

void ResultReporter::printError(const std::string &message)
{
    if (useColor_)
    {
        fmt::print(err_, fmt::fg(fmt::color::red), "✗ {}", message);
        fmt::print(err_, "\n");
    }
    else
    {
        fmt::print(err_, "✗ {}\n", message);
    }
}

std::string ResultReporter::verdict(const ComparisonOutcome &outcome)
{
    if (outcome.matched)
    {
        return outcome.expectedValue ? "MATCH EXPECTED" : "MATCH";
    }
    if (outcome.expectedValue)
    {
        return fmt::format("MISMATCH, expected {}", *outcome.expectedValue);
    }
    return "MISMATCH";
}

std::string ResultReporter::formatRow(const std::string &algorithm,
                                      const std::string &hash,
                                      const std::string &path,
                                      size_t hashWidth)
{
    return fmt::format("{:<{}}  {:<{}}  {}\n", algorithm, ALGORITHM_WIDTH, hash, hashWidth, path);
}
