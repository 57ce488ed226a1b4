#pragma once

#include <memory>
#include <ostream>
#include "fold.h"

// Maximum pairing by the Nussinov recursion, parameterised over a pair
// model providing allow_paired(i, j) and score_paired(i, j).
template < typename P, typename S = typename P::ScoreType >
class Nussinov : public Fold
{
    public:
        using ScoreType = S;

    public:
        Nussinov(std::unique_ptr<P>&& p);
        auto compute_viterbi(const std::string& seq, Options opts = Options()) -> ScoreType;
        auto traceback_viterbi() const -> std::vector<Pair>;
        void print_table(std::ostream& os) const;

        const P& param_model() const { return *param_; }
        const TriMatrix<ScoreType>& table() const { return Dv_; }

        static auto traceback(const TriMatrix<ScoreType>& dp, const P& param, const Options& opts) -> std::vector<Pair>;

    private:
        std::unique_ptr<P> param_;
        Options opts_;
        TriMatrix<ScoreType> Dv_;
};
