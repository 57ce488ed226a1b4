#include <regex>
#include <stdexcept>
#include "arguments.h"

auto
parse_gap(const std::string& v) -> int
{
    if (!std::regex_match(v, std::regex("\\s*\\d+\\s*")))
        throw std::runtime_error("--gap expects a non-negative integer, got '" + v + "'");
    try {
        return std::stoi(v);
    } catch (std::out_of_range&) {
        throw std::runtime_error("--gap value out of range: " + v);
    }
}
