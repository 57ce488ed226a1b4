#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "nussinov.h"

template < typename S >
struct Prediction
{
    S score;
    std::optional<std::string> structure; // empty in score-only mode
    std::vector<Fold::Pair> pairs;
};

// (sequence, model, gap) -> (score, optional annotation)
template < class ParamClass >
auto predict_nussinov(const std::string& seq, const typename ParamClass::ConfigType& conf,
            Fold::Options options, bool with_structure = true, std::ostream* table_out = nullptr)
    -> Prediction<typename ParamClass::ScoreType>
{
    auto param = std::make_unique<ParamClass>(seq, conf);
    Nussinov<ParamClass> f(std::move(param));
    Prediction<typename ParamClass::ScoreType> res;
    res.score = f.compute_viterbi(seq, options);
    if (table_out)
        f.print_table(*table_out);
    if (with_structure)
    {
        res.pairs = f.traceback_viterbi();
        res.structure = f.param_model().make_paren(res.pairs);
    }
    return res;
}
