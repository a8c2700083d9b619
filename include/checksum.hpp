#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>

/**
 * Thrown when a file cannot be hashed (vanished, unreadable, or an
 * OpenSSL failure). Always fatal for the current run.
 */
class HashComputationError : public std::runtime_error
{
public:
    explicit HashComputationError(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * File digest computation using OpenSSL's EVP interface.
 * Supports MD5, SHA-1, SHA-256, SHA-384 and SHA-512.
 */
class Checksum
{
public:
    /**
     * Supported hash algorithms.
     * Every algorithm has a distinct hex digest length.
     */
    enum class Algorithm
    {
        MD5,
        SHA1,
        SHA256,
        SHA384,
        SHA512
    };

    /**
     * Compute the digest of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @param algorithm Hash algorithm to apply
     * @return Lowercase hex-encoded digest
     * @throws HashComputationError if file cannot be read
     */
    static std::string computeDigest(const std::filesystem::path &filePath,
                                     Algorithm algorithm);

    /**
     * Compare two hex digests, ignoring case and surrounding whitespace.
     * Digests of equal length are compared in constant time.
     */
    static bool digestsEqual(const std::string &lhs, const std::string &rhs);

    /**
     * Canonical upper-case name, e.g. "SHA256".
     */
    static std::string algorithmName(Algorithm algorithm);

    /**
     * Parse an algorithm name (case-insensitive, "sha-256" accepted).
     *
     * @throws std::invalid_argument if the name is unknown
     */
    static Algorithm parseAlgorithm(const std::string &name);

    /**
     * Number of hex characters in a digest of this algorithm.
     */
    static size_t digestLength(Algorithm algorithm);

    /**
     * Algorithm whose digest has exactly this many hex characters.
     */
    static std::optional<Algorithm> algorithmForLength(size_t length);

    /**
     * All algorithms, strongest first.
     */
    static const std::vector<Algorithm> &allAlgorithms();

    /**
     * True if the string (after trimming) contains only hex digits.
     */
    static bool isHexDigest(const std::string &digest);

    /**
     * Lowercase and strip surrounding whitespace.
     */
    static std::string normalizeHex(const std::string &hex);

    /**
     * Strip surrounding whitespace, keeping case.
     */
    static std::string stripWhitespace(const std::string &text);

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
