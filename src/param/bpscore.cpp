#include <string>
#include <stdexcept>
#include "bpscore.h"

PairTable::
PairTable()
    : score_(256, std::vector<ScoreType>(256, ILLEGAL))
{
}

PairTable&
PairTable::
set(char x, char y, ScoreType s)
{
    if (s < 0)
        throw std::invalid_argument("negative score for pair " + std::string{x, '-', y});
    if (s > MAX_SCORE)
        throw std::invalid_argument("score for pair " + std::string{x, '-', y}
            + " exceeds " + std::to_string(MAX_SCORE));
    score_[idx(x)][idx(y)] = s;
    return *this;
}

auto
PairTable::
pairs() const -> std::vector<std::pair<std::string, ScoreType>>
{
    std::vector<std::pair<std::string, ScoreType>> ret;
    for (size_t x=0; x!=score_.size(); ++x)
        for (size_t y=0; y!=score_[x].size(); ++y)
            if (score_[x][y] != ILLEGAL)
                ret.emplace_back(std::string{static_cast<char>(x), static_cast<char>(y)}, score_[x][y]);
    return ret;
}

bool
PairTable::
empty() const
{
    for (const auto& row : score_)
        for (auto s : row)
            if (s != ILLEGAL) return false;
    return true;
}

//static
PairTable
PairTable::
canonical()
{
    PairTable t;
    t.set('A', 'U', 1).set('U', 'A', 1)
        .set('G', 'C', 1).set('C', 'G', 1);
    return t;
}

//static
PairTable
PairTable::
weighted()
{
    PairTable t;
    t.set('A', 'U', 2).set('U', 'A', 2)
        .set('G', 'C', 3).set('C', 'G', 3);
    return t;
}

BasePairScore::
BasePairScore(const std::string& seq, const PairTable& table) :
    seq_(seq),
    table_(table)
{
}

bool
BasePairScore::
allow_paired(size_t i, size_t j) const
{
    return table_.contains(seq_[i], seq_[j]);
}

auto
BasePairScore::
score_paired(size_t i, size_t j) const -> ScoreType
{
    return table_.score(seq_[i], seq_[j]);
}

auto
BasePairScore::
make_paren(const std::vector<Fold::Pair>& p) const -> std::string
{
    return Fold::make_paren(p, seq_.size());
}
