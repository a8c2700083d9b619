#include "validator.hpp"
#include "algorithm_resolver.hpp"
#include <algorithm>
#include <system_error>
#include <utility>
#include <fmt/core.h>

namespace
{
    std::string summarize(const std::vector<ValidationIssue> &issues)
    {
        if (issues.size() == 1)
        {
            return issues.front().message;
        }
        return fmt::format("{} validation errors, first: {}",
                           issues.size(),
                           issues.empty() ? std::string() : issues.front().message);
    }

    void checkPaths(const std::vector<std::string> &files, std::vector<ValidationIssue> &issues)
    {
        for (const auto &file : files)
        {
            std::error_code ec;
            std::filesystem::file_status status = std::filesystem::status(file, ec);

            if (ec && status.type() != std::filesystem::file_type::not_found)
            {
                issues.push_back({ValidationIssue::Kind::PathInaccessible, file,
                                  fmt::format("Cannot access path {}: {}", file, ec.message())});
            }
            else if (!std::filesystem::exists(status))
            {
                issues.push_back({ValidationIssue::Kind::PathNotFound, file,
                                  fmt::format("Path not found: {}", file)});
            }
            else if (std::filesystem::is_directory(status))
            {
                issues.push_back({ValidationIssue::Kind::PathIsDirectory, file,
                                  fmt::format("Path is a directory, not a file: {}", file)});
            }
            else if (!std::filesystem::is_regular_file(status))
            {
                issues.push_back({ValidationIssue::Kind::PathIsDirectory, file,
                                  fmt::format("Path is not a regular file: {}", file)});
            }
        }
    }
}

ValidationError::ValidationError(std::vector<ValidationIssue> issues)
    : std::runtime_error(summarize(issues)), issues_(std::move(issues))
{
}

bool ValidationError::has(ValidationIssue::Kind kind) const
{
    return std::any_of(issues_.begin(), issues_.end(),
                       [kind](const ValidationIssue &issue) { return issue.kind == kind; });
}

RunConfiguration InputValidator::validate(const CompareRequest &request)
{
    std::vector<ValidationIssue> issues;
    const bool expectedMode = request.expectedHash.has_value();

    // 1. File count depends on the mode
    const size_t requiredFiles = expectedMode ? 1 : 2;
    if (request.files.size() < requiredFiles)
    {
        issues.push_back({ValidationIssue::Kind::InsufficientFiles, "",
                          expectedMode
                              ? std::string("At least one file is required to compare against an expected hash")
                              : fmt::format("At least two files are required to compare, got {}",
                                            request.files.size())});
    }

    // 2. Every path must be an existing regular file
    checkPaths(request.files, issues);

    // 3. Algorithm names, every unknown one reported
    std::vector<std::string> names = AlgorithmResolver::splitNames(request.algorithms);
    bool namesValid = true;
    for (const auto &name : names)
    {
        if (AlgorithmResolver::isAll(name))
        {
            continue;
        }
        try
        {
            Checksum::parseAlgorithm(name);
        }
        catch (const std::invalid_argument &)
        {
            namesValid = false;
            issues.push_back({ValidationIssue::Kind::UnknownAlgorithm, name,
                              fmt::format("Unknown algorithm '{}', expected one of {} or {}",
                                          name, AlgorithmResolver::lengthTable(), AlgorithmResolver::ALL)});
        }
    }

    std::vector<Checksum::Algorithm> algorithms;
    if (namesValid)
    {
        algorithms = AlgorithmResolver::resolve(request.algorithms);
    }

    // 4. Expected-hash mode derives its own algorithm
    std::optional<std::string> expectedDigest;
    if (expectedMode)
    {
        const std::string &expected = *request.expectedHash;

        const bool explicitSelection =
            !names.empty() &&
            !(namesValid && algorithms == std::vector<Checksum::Algorithm>{AlgorithmResolver::DEFAULT_ALGORITHM});
        if (explicitSelection)
        {
            issues.push_back({ValidationIssue::Kind::ConflictingModes, "",
                              "An expected hash cannot be combined with an explicit algorithm selection; "
                              "the algorithm is inferred from the hash length"});
        }

        if (!Checksum::isHexDigest(expected))
        {
            issues.push_back({ValidationIssue::Kind::MalformedDigest, expected,
                              fmt::format("Expected hash '{}' is not a hexadecimal string", expected)});
        }

        std::optional<Checksum::Algorithm> inferred = AlgorithmResolver::inferFromDigest(expected);
        if (!inferred)
        {
            issues.push_back({ValidationIssue::Kind::UnsupportedDigestLength, expected,
                              fmt::format("Expected hash has {} characters, which matches no supported algorithm ({})",
                                          Checksum::normalizeHex(expected).length(),
                                          AlgorithmResolver::lengthTable())});
        }
        else
        {
            algorithms = {*inferred};
        }

        // Case is kept so the verdict echoes the digest as given
        expectedDigest = Checksum::stripWhitespace(expected);
    }

    if (!issues.empty())
    {
        throw ValidationError(std::move(issues));
    }

    RunConfiguration config;
    config.files.assign(request.files.begin(), request.files.end());
    config.algorithms = std::move(algorithms);
    config.expectedDigest = std::move(expectedDigest);
    config.quiet = request.quiet;
    config.fast = request.fast;
    return config;
}
