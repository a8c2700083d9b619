#include "algorithm_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <fmt/core.h>

std::vector<Checksum::Algorithm> AlgorithmResolver::resolve(const std::vector<std::string> &selection)
{
    std::vector<std::string> names = splitNames(selection);

    if (names.empty())
    {
        return {DEFAULT_ALGORITHM};
    }

    // "All" wins over whatever else was named
    if (std::any_of(names.begin(), names.end(), isAll))
    {
        // Still reject typos next to "All"
        for (const auto &name : names)
        {
            if (!isAll(name))
            {
                Checksum::parseAlgorithm(name);
            }
        }
        return Checksum::allAlgorithms();
    }

    std::vector<Checksum::Algorithm> algorithms;
    for (const auto &name : names)
    {
        Checksum::Algorithm algorithm = Checksum::parseAlgorithm(name);
        if (std::find(algorithms.begin(), algorithms.end(), algorithm) == algorithms.end())
        {
            algorithms.push_back(algorithm);
        }
    }
    return algorithms;
}

std::optional<Checksum::Algorithm> AlgorithmResolver::inferFromDigest(const std::string &expectedDigest)
{
    return Checksum::algorithmForLength(Checksum::stripWhitespace(expectedDigest).length());
}

std::string AlgorithmResolver::lengthTable()
{
    const auto &algorithms = Checksum::allAlgorithms();

    // Ascending by digest length
    std::string table;
    for (auto it = algorithms.rbegin(); it != algorithms.rend(); ++it)
    {
        if (!table.empty())
        {
            table += ", ";
        }
        table += fmt::format("{}: {}", Checksum::algorithmName(*it), Checksum::digestLength(*it));
    }
    return table;
}

bool AlgorithmResolver::isAll(const std::string &name)
{
    std::string key = Checksum::stripWhitespace(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return key == "all";
}

std::vector<std::string> AlgorithmResolver::splitNames(const std::vector<std::string> &selection)
{
    std::vector<std::string> names;
    for (const auto &entry : selection)
    {
        std::istringstream stream(entry);
        std::string token;
        while (std::getline(stream, token, ','))
        {
            token = Checksum::stripWhitespace(token);
            if (!token.empty())
            {
                names.push_back(token);
            }
        }
    }
    return names;
}
