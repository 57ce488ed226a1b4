#pragma once

#include <array>
#include <string>
#include <vector>
#include "../fold/fold.h"

// Stacking scores between the six legal dinucleotides
// AU, UA, GC, CG, GU, UG (indices 0..5).
class StackingTable
{
    public:
        using ScoreType = int;
        static constexpr size_t NUM_DINUCLEOTIDES = 6;
        static constexpr ScoreType MAX_SCORE = 10000;
        using Matrix = std::array<std::array<ScoreType, NUM_DINUCLEOTIDES>, NUM_DINUCLEOTIDES>;

    public:
        StackingTable();
        explicit StackingTable(const Matrix& m);

        StackingTable& set(size_t p, size_t q, ScoreType s);
        ScoreType score(size_t p, size_t q) const { return matrix_[p][q]; }
        const Matrix& matrix() const { return matrix_; }

        // index of the dinucleotide xy, or -1 if it is not a legal pair
        static int index(char x, char y);
        static auto name(size_t p) -> std::string;

        // every legal stacking scores 1
        static StackingTable uniform();

    private:
        Matrix matrix_;
};

class StackedPairScore
{
    public:
        using ScoreType = StackingTable::ScoreType;
        using ConfigType = StackingTable;

    public:
        StackedPairScore(const std::string& seq, const StackingTable& table);
        ~StackedPairScore() {};

        bool allow_paired(size_t i, size_t j) const;
        ScoreType score_paired(size_t i, size_t j) const;
        auto make_paren(const std::vector<Fold::Pair>& p) const -> std::string;

        size_t size() const { return dinuc_.size(); }

    private:
        static auto convert_sequence(const std::string& seq) -> std::vector<int>;

    private:
        std::vector<int> dinuc_;
        StackingTable table_;
};
