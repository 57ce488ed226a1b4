#pragma once

#include <string>

// value of --gap; throws std::runtime_error unless v is a non-negative integer
auto parse_gap(const std::string& v) -> int;
