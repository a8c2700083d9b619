#pragma once

#include <cstdio>
#include <string>

#include "comparison_engine.hpp"

class ValidationError;

/**
 * Console output for comparison runs: digest table, verdict and errors.
 */
class ResultReporter
{
public:
    /**
     * @param out Stream for the digest table and verdict
     * @param err Stream for diagnostics
     * @param useColor Color the verdict and diagnostics
     */
    explicit ResultReporter(std::FILE *out = stdout, std::FILE *err = stderr, bool useColor = false);

    /**
     * Print one table row for a computed digest.
     *
     * @param entry File whose digest was just computed
     * @param algorithm Algorithm of the digest to print
     * @param withHeader Print the column header and underline first
     * @param hashWidth Hash column width shared by every row of the table;
     *                  0 uses the digest length of this algorithm
     */
    void printDigestRow(const FileEntry &entry, Checksum::Algorithm algorithm, bool withHeader,
                        size_t hashWidth = 0);

    /**
     * Print the verdict line.
     */
    void printVerdict(const ComparisonOutcome &outcome);

    /**
     * Print every validation issue, one per line.
     */
    void printIssues(const ValidationError &error);

    /**
     * Print a fatal error.
     */
    void printError(const std::string &message);

    /**
     * "MATCH", "MATCH EXPECTED", "MISMATCH" or "MISMATCH, expected <value>".
     */
    static std::string verdict(const ComparisonOutcome &outcome);

    /**
     * One aligned table line; the hash column is padded to hashWidth.
     */
    static std::string formatRow(const std::string &algorithm,
                                 const std::string &hash,
                                 const std::string &path,
                                 size_t hashWidth);

private:
    std::FILE *out_;
    std::FILE *err_;
    bool useColor_;
};
