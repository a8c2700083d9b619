#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include "config.hpp"

/**
 * One problem found in a comparison request.
 */
struct ValidationIssue
{
    enum class Kind
    {
        InsufficientFiles,
        PathNotFound,
        PathIsDirectory, // Exists but is not a regular file
        PathInaccessible, // Status query failed for a reason other than absence
        ConflictingModes,
        UnsupportedDigestLength,
        UnknownAlgorithm,
        MalformedDigest
    };

    Kind kind;
    std::string subject; // Offending path, name or digest; empty if none
    std::string message;
};

/**
 * Thrown by InputValidator with every issue found in the request.
 */
class ValidationError : public std::runtime_error
{
public:
    explicit ValidationError(std::vector<ValidationIssue> issues);

    const std::vector<ValidationIssue> &issues() const { return issues_; }

    /**
     * True if at least one issue has the given kind.
     */
    bool has(ValidationIssue::Kind kind) const;

private:
    std::vector<ValidationIssue> issues_;
};

/**
 * Pre-flight checks for a comparison request.
 * Nothing is hashed here; the file system is only queried for path status.
 */
class InputValidator
{
public:
    /**
     * Validate a request and build the run configuration.
     *
     * All rules are evaluated before failing, so one ValidationError
     * reports every bad path together with any mode or algorithm problem.
     *
     * @param request Raw request from the command line
     * @return Configuration ready for ComparisonEngine::run
     * @throws ValidationError listing every issue found
     */
    static RunConfiguration validate(const CompareRequest &request);
};
