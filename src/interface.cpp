#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include "fold/prediction.h"
#include "param/bpscore.h"
#include "param/stacking.h"
#include "param/util.h"

namespace py = pybind11;

template < class ParamClass >
auto predict_nussinov_py(const std::string& seq, const typename ParamClass::ConfigType& conf,
            int gap, bool structure, bool bifurcation_traceback)
{
    if (gap < 0)
        throw py::value_error("gap must be non-negative");
    auto options = Fold::Options()
        .min_hairpin_loop_length(gap)
        .bifurcation_traceback(bifurcation_traceback);
    auto r = predict_nussinov<ParamClass>(seq, conf, options, structure);
    return std::make_tuple(r.score, r.structure, r.pairs);
}

auto predict(const std::string& seq, const std::string& model, int gap, bool structure,
            bool bifurcation_traceback, py::object pair_table, py::object stacking)
{
    if (model == "stacked")
        return predict_nussinov_py<StackedPairScore>(seq, get_stacking(stacking),
                    gap, structure, bifurcation_traceback);
    if (model == "weighted")
        return predict_nussinov_py<BasePairScore>(seq, get_pair_table(pair_table, PairTable::weighted()),
                    gap, structure, bifurcation_traceback);
    if (model == "flat")
        return predict_nussinov_py<BasePairScore>(seq, get_pair_table(pair_table, PairTable::canonical()),
                    gap, structure, bifurcation_traceback);
    throw py::value_error("unknown model: " + model);
}

PYBIND11_MODULE(nussfold, m)
{
    using namespace std::literals::string_literals;
    using namespace pybind11::literals;

    m.doc() = "maximum base pairing of RNA sequences by the Nussinov algorithm";
    m.def("predict", &predict,
        "predict the maximal-pairing secondary structure; returns (score, annotation, pairs)",
        "seq"_a,
        "model"_a="flat"s,
        "gap"_a=0,
        "structure"_a=true,
        "bifurcation_traceback"_a=true,
        "pair_table"_a=py::none(),
        "stacking"_a=py::none());
}
