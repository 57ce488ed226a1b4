#pragma once

#include <string>
#include <vector>
#include "../fold/fold.h"

// Legal base pairs and their scores, keyed by ordered symbol pair.
class PairTable
{
    public:
        using ScoreType = int;
        static constexpr ScoreType ILLEGAL = -1;
        // keeps the sum over any non-crossing pair set within int
        static constexpr ScoreType MAX_SCORE = 10000;

    public:
        PairTable();

        PairTable& set(char x, char y, ScoreType s);
        bool contains(char x, char y) const { return score_[idx(x)][idx(y)] != ILLEGAL; }
        ScoreType score(char x, char y) const { return score_[idx(x)][idx(y)]; }
        auto pairs() const -> std::vector<std::pair<std::string, ScoreType>>;
        bool empty() const;

        // A-U, U-A, G-C, C-G scoring 1 each
        static PairTable canonical();
        // A-U, U-A scoring 2; G-C, C-G scoring 3
        static PairTable weighted();

    private:
        static size_t idx(char c) { return static_cast<unsigned char>(c); }

    private:
        std::vector<std::vector<ScoreType>> score_;
};

class BasePairScore
{
    public:
        using ScoreType = PairTable::ScoreType;
        using ConfigType = PairTable;

    public:
        BasePairScore(const std::string& seq, const PairTable& table);
        ~BasePairScore() {};

        bool allow_paired(size_t i, size_t j) const;
        ScoreType score_paired(size_t i, size_t j) const;
        auto make_paren(const std::vector<Fold::Pair>& p) const -> std::string;

        size_t size() const { return seq_.size(); }

    private:
        std::string seq_;
        PairTable table_;
};
