#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <iomanip>
#include <fmt/core.h>

// OpenSSL headers for EVP digests and constant-time compare
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace
{
    const EVP_MD *messageDigest(Checksum::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case Checksum::Algorithm::MD5:
            return EVP_md5();
        case Checksum::Algorithm::SHA1:
            return EVP_sha1();
        case Checksum::Algorithm::SHA256:
            return EVP_sha256();
        case Checksum::Algorithm::SHA384:
            return EVP_sha384();
        case Checksum::Algorithm::SHA512:
            return EVP_sha512();
        }
        return nullptr;
    }
}

std::string Checksum::computeDigest(const std::filesystem::path &filePath,
                                    Algorithm algorithm)
{
    const std::string name = algorithmName(algorithm);

    // Step 1: Open file in binary mode
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw HashComputationError(
            fmt::format("Cannot open file for hashing: {}", filePath.string()));
    }

    // Step 2: Create the EVP context, freed on every exit path
    auto contextDeleter = [](EVP_MD_CTX *ctx)
    {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    };
    std::unique_ptr<EVP_MD_CTX, decltype(contextDeleter)> context(EVP_MD_CTX_new(), contextDeleter);
    if (!context)
    {
        throw HashComputationError("Failed to create OpenSSL context");
    }

    // Step 3: Initialize digest operation for the requested algorithm
    const EVP_MD *md = messageDigest(algorithm);
    if (!md || EVP_DigestInit_ex(context.get(), md, nullptr) != 1)
    {
        throw HashComputationError(fmt::format("Failed to initialize {} digest", name));
    }

    // Step 4: Read file in chunks and update digest
    std::vector<char> buffer(CHUNK_SIZE);

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw HashComputationError(fmt::format("Failed to update {} digest", name));
        }
    }

    if (file.bad())
    {
        throw HashComputationError(
            fmt::format("Read error while hashing: {}", filePath.string()));
    }

    // Step 5: Finalize the hash
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw HashComputationError(fmt::format("Failed to finalize {} digest", name));
    }

    // Step 6: Convert binary hash to hexadecimal string
    std::vector<unsigned char> hashVector(hash, hash + hashLength);
    return toHex(hashVector);
}

bool Checksum::digestsEqual(const std::string &lhs, const std::string &rhs)
{
    std::string left = normalizeHex(lhs);
    std::string right = normalizeHex(rhs);

    if (left.size() != right.size())
    {
        return false;
    }

    return CRYPTO_memcmp(left.data(), right.data(), left.size()) == 0;
}

std::string Checksum::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::MD5:
        return "MD5";
    case Algorithm::SHA1:
        return "SHA1";
    case Algorithm::SHA256:
        return "SHA256";
    case Algorithm::SHA384:
        return "SHA384";
    case Algorithm::SHA512:
        return "SHA512";
    }
    return "UNKNOWN";
}

Checksum::Algorithm Checksum::parseAlgorithm(const std::string &name)
{
    std::string key;
    for (char ch : stripWhitespace(name))
    {
        // "SHA-256" and "sha256" name the same algorithm
        if (ch != '-')
        {
            key += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
    }

    for (Algorithm algorithm : allAlgorithms())
    {
        if (algorithmName(algorithm) == key)
        {
            return algorithm;
        }
    }

    throw std::invalid_argument(fmt::format("Unsupported algorithm: '{}'", name));
}

size_t Checksum::digestLength(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::MD5:
        return 32; // 128 bits / 4 bits per hex digit
    case Algorithm::SHA1:
        return 40;
    case Algorithm::SHA256:
        return 64;
    case Algorithm::SHA384:
        return 96;
    case Algorithm::SHA512:
        return 128;
    }
    return 0;
}

std::optional<Checksum::Algorithm> Checksum::algorithmForLength(size_t length)
{
    for (Algorithm algorithm : allAlgorithms())
    {
        if (digestLength(algorithm) == length)
        {
            return algorithm;
        }
    }
    return std::nullopt;
}

const std::vector<Checksum::Algorithm> &Checksum::allAlgorithms()
{
    static const std::vector<Algorithm> algorithms = {
        Algorithm::SHA512,
        Algorithm::SHA384,
        Algorithm::SHA256,
        Algorithm::SHA1,
        Algorithm::MD5};
    return algorithms;
}

bool Checksum::isHexDigest(const std::string &digest)
{
    std::string trimmed = stripWhitespace(digest);
    return !trimmed.empty() &&
           std::all_of(trimmed.begin(), trimmed.end(),
                       [](unsigned char ch) { return std::isxdigit(ch) != 0; });
}

std::string Checksum::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string Checksum::normalizeHex(const std::string &hex)
{
    std::string result = stripWhitespace(hex);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

std::string Checksum::stripWhitespace(const std::string &text)
{
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto first = std::find_if(text.begin(), text.end(), notSpace);
    auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return first < last ? std::string(first, last) : std::string();
}
