#pragma once

#include <vector>
#include <string>
#include <utility>
#include <sys/types.h>
#include "trimatrix.h"

class Fold
{
    public:
        using Pair = std::pair<u_int32_t, u_int32_t>;

        struct Options
        {
            size_t min_hairpin;
            bool trace_bifurcation;

            Options() :
                min_hairpin(0),
                trace_bifurcation(true)
            {
            }

            // positions i and j may pair only if j-i > s
            Options& min_hairpin_loop_length(size_t s)
            {
                this->min_hairpin = s;
                return *this;
            }

            // when neither "j unpaired" nor a closing pair explains a cell,
            // recover the split point instead of dropping the interval
            Options& bifurcation_traceback(bool b)
            {
                this->trace_bifurcation = b;
                return *this;
            }
        };

        static constexpr char OPEN = '{';
        static constexpr char CLOSE = '}';
        static constexpr char UNPAIRED = '.';

    public:
        static auto make_paren(const std::vector<Pair>& p, size_t L) -> std::string;
        static auto make_stacked_paren(const std::vector<Pair>& p, size_t L) -> std::string;
        static auto parse_paren(const std::string& paren) -> std::vector<Pair>;
        static void validate_sequence(const std::string& seq);
};
