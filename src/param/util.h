#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "bpscore.h"
#include "stacking.h"

namespace py = pybind11;

// {("A", "U"): 2, ...} or {"AU": 2, ...}
inline
auto
get_pair_table(py::object obj, const PairTable& def)
{
    if (obj.is_none())
        return def;
    PairTable t;
    for (auto item : py::cast<py::dict>(obj))
    {
        std::string key;
        if (py::isinstance<py::tuple>(item.first))
        {
            auto [x, y] = item.first.cast<std::pair<std::string, std::string>>();
            key = x + y;
        }
        else
            key = item.first.cast<std::string>();
        if (key.size() != 2)
            throw py::value_error("pair table keys must name two symbols: " + key);
        t.set(key[0], key[1], item.second.cast<int>());
    }
    return t;
}

inline
auto
get_stacking(py::object obj)
{
    if (obj.is_none())
        return StackingTable::uniform();
    const auto N = StackingTable::NUM_DINUCLEOTIDES;
    auto v = obj.cast<std::vector<std::vector<int>>>();
    if (v.size() != N)
        throw py::value_error("stacking matrix must be 6x6");
    StackingTable::Matrix m;
    for (size_t p=0; p!=N; ++p)
    {
        if (v[p].size() != N)
            throw py::value_error("stacking matrix must be 6x6");
        for (size_t q=0; q!=N; ++q)
            m[p][q] = v[p][q];
    }
    return StackingTable(m);
}
