#pragma once

#include <string>
#include <vector>
#include <optional>

#include "checksum.hpp"

/**
 * Turns the user's algorithm selection into the list of algorithms to run.
 */
class AlgorithmResolver
{
public:
    /**
     * Expand a selection into an ordered, duplicate-free algorithm list.
     *
     * Each entry may hold a comma-separated list. An empty selection yields
     * the default (SHA512); "All" anywhere yields every algorithm, strongest
     * first. Otherwise algorithms keep the order they were first named in.
     *
     * @param selection Algorithm names as typed by the user
     * @return Algorithms to run, never empty
     * @throws std::invalid_argument naming the first unknown algorithm
     */
    static std::vector<Checksum::Algorithm> resolve(const std::vector<std::string> &selection);

    /**
     * Infer the algorithm of an expected digest from its length.
     *
     * @param expectedDigest Hex digest (surrounding whitespace ignored)
     * @return The algorithm with that digest length, or nullopt
     */
    static std::optional<Checksum::Algorithm> inferFromDigest(const std::string &expectedDigest);

    /**
     * Supported lengths as "MD5: 32, SHA1: 40, ..." for diagnostics.
     */
    static std::string lengthTable();

    /**
     * True for the "All" sentinel, in any case.
     */
    static bool isAll(const std::string &name);

    /**
     * Split comma lists into trimmed, non-empty names.
     */
    static std::vector<std::string> splitNames(const std::vector<std::string> &selection);

    static constexpr const char *ALL = "All";
    static constexpr Checksum::Algorithm DEFAULT_ALGORITHM = Checksum::Algorithm::SHA512;
};
