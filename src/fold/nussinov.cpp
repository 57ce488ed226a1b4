#include <algorithm>
#include <stack>
#include <stdexcept>
#include "nussinov.h"
#include "../param/bpscore.h"
#include "../param/stacking.h"

template < typename P, typename S >
Nussinov<P, S>::
Nussinov(std::unique_ptr<P>&& p)
    : param_(std::move(p))
{

}

template < typename P, typename S >
auto
Nussinov<P, S>::
compute_viterbi(const std::string& seq, Options opts /*= Options()*/) -> ScoreType
{
    const int L = seq.size();
    if (static_cast<int>(param_->size()) != L)
        throw std::invalid_argument("pair model is bound to a sequence of length "
            + std::to_string(param_->size()) + ", got " + std::to_string(L));
    const int min_bp = opts.min_hairpin;
    opts_ = opts;
    Dv_.clear(); Dv_.resize(L, 0, 0);

    // fill by increasing distance from the diagonal
    for (auto d=1; d<L; d++)
    {
        for (auto i=0; i+d<L; i++)
        {
            const auto j = i+d;
            if (j-i <= min_bp)
            {
                Dv_[i][j] = 0;
                continue;
            }

            auto v = std::max(Dv_.at(i+1, j), Dv_.at(i, j-1));

            if (param_->allow_paired(i, j))
                v = std::max(v, Dv_.at(i+1, j-1) + param_->score_paired(i, j));

            for (auto k=i+1; k<j; k++)
                v = std::max(v, Dv_[i][k] + Dv_[k+1][j]);

            Dv_[i][j] = v;
        }
    }

    return L>0 ? Dv_[0][L-1] : ScoreType(0);
}

template < typename P, typename S >
auto
Nussinov<P, S>::
traceback_viterbi() const -> std::vector<Pair>
{
    return traceback(Dv_, *param_, opts_);
}

//static
template < typename P, typename S >
auto
Nussinov<P, S>::
traceback(const TriMatrix<ScoreType>& dp, const P& param, const Options& opts) -> std::vector<Pair>
{
    const int L = dp.size();
    const int min_bp = opts.min_hairpin;
    std::vector<Pair> pair;
    if (L == 0)
        return pair;

    std::stack<std::pair<int, int>> tb_stack;
    tb_stack.emplace(0, L-1);

    while (!tb_stack.empty())
    {
        const auto [i, j] = tb_stack.top();
        tb_stack.pop();
        if (j <= i)
            continue;

        const auto v = dp.at(i, j);

        // j unpaired takes precedence over any pair
        if (v == dp.at(i, j-1))
        {
            tb_stack.emplace(i, j-1);
            continue;
        }

        // smallest k closing a pair with j
        bool found = false;
        for (auto k=i; k<j-min_bp; k++)
        {
            if (param.allow_paired(k, j) &&
                    v == dp.at(i, k-1) + dp.at(k+1, j-1) + param.score_paired(k, j))
            {
                pair.emplace_back(k, j);
                tb_stack.emplace(k+1, j-1);
                tb_stack.emplace(i, k-1);
                found = true;
                break;
            }
        }

        if (found || !opts.trace_bifurcation)
            continue;

        for (auto k=i+1; k<j; k++)
        {
            if (v == dp.at(i, k) + dp.at(k+1, j))
            {
                tb_stack.emplace(k+1, j);
                tb_stack.emplace(i, k);
                break;
            }
        }
    }

    return pair;
}

template < typename P, typename S >
void
Nussinov<P, S>::
print_table(std::ostream& os) const
{
    const int L = Dv_.size();
    for (auto i=0; i!=L; ++i)
    {
        for (auto j=0; j!=L; ++j)
            os << (j>0 ? " " : "") << Dv_.at(i, j);
        os << std::endl;
    }
}

template class Nussinov<BasePairScore>;
template class Nussinov<StackedPairScore>;
