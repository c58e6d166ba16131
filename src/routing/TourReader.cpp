// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#include "routing/TourReader.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

#include <fmt/format.h>
#include <range/v3/algorithm/reverse.hpp>

#include "utils/OptimizerError.h"
#include "utils/string.h"

namespace travel
{

namespace
{

std::optional<long long> parseInteger(std::string_view text)
{
    long long value = 0;
    const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc() || end != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

/*!
 * Read the header field of an LKH tour file that holds the tour length: "COMMENT : Length = 12345".
 */
std::optional<coord_t> parseLength(std::string_view comment)
{
    const size_t length_pos = comment.find("Length");
    if (length_pos == std::string_view::npos)
    {
        return std::nullopt;
    }
    const size_t equals = comment.find('=', length_pos);
    if (equals == std::string_view::npos)
    {
        return std::nullopt;
    }
    return parseInteger(trim(comment.substr(equals + 1)));
}

} // namespace

Tour TourReader::read(std::istream& in, const Problem& problem)
{
    const size_t dimension = problem.dimension();
    Tour tour;
    std::vector<size_t> cycle;
    bool in_section = false;
    bool seen_section = false;
    bool terminated = false;

    std::string line;
    while (! terminated && std::getline(in, line))
    {
        const std::string_view content = trim(line);
        if (! in_section)
        {
            if (content.empty())
            {
                continue;
            }
            if (content.starts_with("TOUR_SECTION"))
            {
                in_section = true;
                seen_section = true;
                continue;
            }
            if (content.starts_with("EOF"))
            {
                break;
            }
            const size_t colon = content.find(':');
            if (colon == std::string_view::npos)
            {
                continue;
            }
            const std::string_view key = trim(content.substr(0, colon));
            const std::string_view value = trim(content.substr(colon + 1));
            if (key == "COMMENT" && ! tour.reported_length)
            {
                tour.reported_length = parseLength(value);
            }
            else if (key == "DIMENSION")
            {
                const std::optional<long long> declared = parseInteger(value);
                if (! declared || *declared != static_cast<long long>(dimension))
                {
                    throw TourValidationError(fmt::format("dimension {} doesn't match the {} nodes of the problem", value, dimension));
                }
            }
            continue;
        }

        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token)
        {
            if (token == "EOF")
            {
                terminated = true;
                break;
            }
            const std::optional<long long> node = parseInteger(token);
            if (! node)
            {
                throw TourValidationError(fmt::format("'{}' is not a node index", token));
            }
            if (*node == -1)
            {
                terminated = true;
                break;
            }
            if (*node < 1 || *node > static_cast<long long>(dimension))
            {
                throw TourValidationError(fmt::format("node {} is out of range 1..{}", *node, dimension));
            }
            cycle.push_back(static_cast<size_t>(*node - 1));
        }
    }

    if (! seen_section)
    {
        throw TourValidationError("no TOUR_SECTION");
    }
    if (cycle.size() != dimension)
    {
        throw TourValidationError(fmt::format("tour visits {} nodes, the problem has {}", cycle.size(), dimension));
    }
    std::vector<bool> visited(dimension, false);
    for (const size_t node : cycle)
    {
        if (visited[node])
        {
            throw TourValidationError(fmt::format("node {} is visited twice", node + 1));
        }
        visited[node] = true;
    }

    std::rotate(cycle.begin(), std::find(cycle.begin(), cycle.end(), Problem::start_node), cycle.end());
    std::vector<size_t> reversed = cycle;
    ranges::reverse(reversed.begin() + 1, reversed.end());
    tour.nodes = pathLength(reversed, problem) < pathLength(cycle, problem) ? std::move(reversed) : std::move(cycle);
    return tour;
}

Tour TourReader::readFile(const std::filesystem::path& path, const Problem& problem)
{
    std::ifstream in(path);
    if (! in.is_open())
    {
        throw TourValidationError(fmt::format("can't open {}", path.string()));
    }
    return read(in, problem);
}

coord_t TourReader::pathLength(const std::vector<size_t>& nodes, const Problem& problem)
{
    coord_t length = 0;
    for (size_t idx = 1; idx < nodes.size(); idx++)
    {
        length += problem.distance(nodes[idx - 1], nodes[idx]);
    }
    return length;
}

} // namespace travel
