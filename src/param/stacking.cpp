#include <string>
#include <stdexcept>
#include "stacking.h"

StackingTable::
StackingTable()
{
    for (auto& row : matrix_)
        row.fill(0);
}

StackingTable::
StackingTable(const Matrix& m)
    : matrix_(m)
{
    for (const auto& row : matrix_)
        for (auto s : row)
            if (s < 0 || s > MAX_SCORE)
                throw std::invalid_argument("stacking score out of range: " + std::to_string(s));
}

StackingTable&
StackingTable::
set(size_t p, size_t q, ScoreType s)
{
    if (p >= NUM_DINUCLEOTIDES || q >= NUM_DINUCLEOTIDES)
        throw std::out_of_range("dinucleotide index out of range");
    if (s < 0)
        throw std::invalid_argument("negative stacking score for " + name(p) + "/" + name(q));
    if (s > MAX_SCORE)
        throw std::invalid_argument("stacking score for " + name(p) + "/" + name(q)
            + " exceeds " + std::to_string(MAX_SCORE));
    matrix_[p][q] = s;
    return *this;
}

//static
int
StackingTable::
index(char x, char y)
{
    switch (x)
    {
        case 'A':
            return y=='U' ? 0 : -1;
        case 'U':
            return y=='A' ? 1 : y=='G' ? 5 : -1;
        case 'G':
            return y=='C' ? 2 : y=='U' ? 4 : -1;
        case 'C':
            return y=='G' ? 3 : -1;
        default:
            return -1;
    }
}

//static
auto
StackingTable::
name(size_t p) -> std::string
{
    static const char* names[NUM_DINUCLEOTIDES] = { "AU", "UA", "GC", "CG", "GU", "UG" };
    return p < NUM_DINUCLEOTIDES ? names[p] : "??";
}

//static
StackingTable
StackingTable::
uniform()
{
    StackingTable t;
    for (auto& row : t.matrix_)
        row.fill(1);
    return t;
}

StackedPairScore::
StackedPairScore(const std::string& seq, const StackingTable& table) :
    dinuc_(convert_sequence(seq)),
    table_(table)
{
}

//static
auto
StackedPairScore::
convert_sequence(const std::string& seq) -> std::vector<int>
{
    // the last position has no successor and never forms a dinucleotide
    std::vector<int> d(seq.size(), -1);
    for (size_t i=0; i+1<seq.size(); ++i)
        d[i] = StackingTable::index(seq[i], seq[i+1]);
    return d;
}

bool
StackedPairScore::
allow_paired(size_t i, size_t j) const
{
    return dinuc_[i] >= 0 && dinuc_[j] >= 0;
}

auto
StackedPairScore::
score_paired(size_t i, size_t j) const -> ScoreType
{
    return table_.score(dinuc_[i], dinuc_[j]);
}

auto
StackedPairScore::
make_paren(const std::vector<Fold::Pair>& p) const -> std::string
{
    return Fold::make_stacked_paren(p, dinuc_.size());
}
