#include <fstream>
#include <sstream>
#include <string>
#include <regex>
#include <cstring>
#include <cerrno>
#include <stdexcept>
#include "parameter.h"

namespace
{
    auto parse_score(const std::string& v, int max, const std::string& line) -> int
    {
        int s;
        try {
            s = std::stoi(v);
        } catch (std::out_of_range&) {
            throw std::runtime_error("score out of range: " + line);
        }
        if (s < 0)
            throw std::runtime_error("negative score: " + line);
        if (s > max)
            throw std::runtime_error("score exceeds " + std::to_string(max) + ": " + line);
        return s;
    }

    auto read_matrix(std::istream& is) -> StackingTable::Matrix
    {
        const auto N = StackingTable::NUM_DINUCLEOTIDES;
        StackingTable::Matrix m;
        size_t n = 0;
        std::string line;
        while (n < N*N && std::getline(is, line))
        {
            line = std::regex_replace(line, std::regex("/\\*.*\\*/"), ""); // remove comment
            std::istringstream ss(line);
            std::string v;
            while (ss >> v)
            {
                if (n == N*N || !std::regex_match(v, std::regex("-?\\d+")))
                    throw std::runtime_error("malformed stacking row: " + line);
                m[n/N][n%N] = parse_score(v, StackingTable::MAX_SCORE, line);
                n++;
            }
        }
        if (n != N*N)
            throw std::runtime_error("stacking matrix needs " + std::to_string(N*N)
                + " values, got " + std::to_string(n));
        return m;
    }
}

void
ModelParameter::
load(const char* filename)
{
    std::ifstream is(filename);
    if (!is) throw std::runtime_error(std::string(strerror(errno)) + ": " + std::string(filename));
    read(is);
}

void
ModelParameter::
read(std::istream& is)
{
    const std::regex header("^# (.+?)\\s*$");
    const std::regex pair_row("^\\s*([A-Za-z])\\s*-?\\s*([A-Za-z])\\s+(-?\\d+)\\s*$");
    std::string line;
    bool pending = false;
    while (pending || std::getline(is, line))
    {
        pending = false;
        if (std::regex_search(line, std::regex("^##"))) // comment
            continue;
        std::smatch m;
        if (!std::regex_match(line, m, header))
        {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            throw std::runtime_error("unexpected line outside of a section: " + line);
        }

        if (m[1] == "pair")
        {
            PairTable t;
            while (std::getline(is, line))
            {
                std::smatch r;
                if (std::regex_search(line, std::regex("^##")))
                    continue;
                if (!std::regex_match(line, r, pair_row))
                {
                    pending = true;
                    break;
                }
                const auto s = parse_score(r[3].str(), PairTable::MAX_SCORE, line);
                t.set(r[1].str()[0], r[2].str()[0], s);
            }
            if (t.empty())
                throw std::runtime_error("empty pair section");
            pair_table_ = t;
        }
        else if (m[1] == "stack")
        {
            stacking_ = StackingTable(read_matrix(is));
        }
        else if (m[1] == "END")
            break;
        else
            throw std::runtime_error("unknown parameter section: " + m[1].str());
    }
}
