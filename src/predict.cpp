#include <string>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <argparse/argparse.hpp>
#include "arguments.h"
#include "fasta.h"
#include "parameter.h"
#include "report.h"
#include "fold/prediction.h"
#include "param/bpscore.h"
#include "param/stacking.h"

using namespace std::literals::string_literals;

template < class ParamClass >
void fold_all(const std::vector<Fasta>& fas, const typename ParamClass::ConfigType& conf,
            Fold::Options opts, bool strict, bool with_structure, const std::string& label,
            bool verbose, std::ostream& os)
{
    for (const auto& fa: fas)
    {
        if (strict)
            Fold::validate_sequence(fa.seq());

        if (verbose)
            std::cerr << "Printing DP-Table:" << std::endl;
        auto r = predict_nussinov<ParamClass>(fa.seq(), conf, opts, with_structure,
                                                verbose ? &std::cerr : nullptr);
        if (verbose)
        {
            std::cerr << "Printing sequence:" << std::endl
                << fa.seq() << std::endl;
            if (r.structure)
                std::cerr << "Printing output:" << std::endl
                    << *r.structure << std::endl;
        }

        write_report(os, fa.seq(), r.score, r.structure, label);
    }
}

int main(int argc, char* argv[])
{
    argparse::ArgumentParser ap("nussfold");
    ap.add_argument("input")
        .help("sequence file: the first line of a text file, or FASTA")
        .default_value("sequence.txt"s);
    ap.add_argument("-o", "--output")
        .help("results file ('-' for standard output)")
        .default_value("output.txt"s);
    ap.add_argument("--model")
        .help("pairing model: flat, weighted or stacked")
        .default_value("flat"s);
    ap.add_argument("--energy")
        .help("use the weighted gamma scores and report the total score only")
        .default_value(false)
        .implicit_value(true);
    ap.add_argument("--gap")
        .help("minimum separation j-i of paired positions (exclusive)")
        .action([](const std::string& v) { return parse_gap(v); })
        .default_value(0);
    ap.add_argument("--param")
        .help("parameter file with '# pair' and/or '# stack' sections")
        .default_value(""s);
    ap.add_argument("--score-only")
        .help("report the optimal score without the annotation")
        .default_value(false)
        .implicit_value(true);
    ap.add_argument("--structure")
        .help("always report the annotation")
        .default_value(false)
        .implicit_value(true);
    ap.add_argument("--no-bifurcation-traceback")
        .help("drop intervals that only a bifurcation explains during traceback")
        .default_value(false)
        .implicit_value(true);
    ap.add_argument("--strict")
        .help("reject sequences with symbols other than A, C, G, U")
        .default_value(false)
        .implicit_value(true);
    ap.add_argument("--verbose")
        .help("print the DP table, sequence and annotation to stderr")
        .default_value(false)
        .implicit_value(true);

    try {
        ap.parse_args(argc, argv);
    } catch (std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << ap;
        return 1;
    } catch (std::logic_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << ap;
        return 1;
    }

    try {
        auto model = ap.get<std::string>("--model");
        if (ap.get<bool>("--energy"))
        {
            if (model != "flat" && model != "weighted")
                throw std::runtime_error("--energy cannot be combined with --model " + model);
            model = "weighted";
        }
        if (model != "flat" && model != "weighted" && model != "stacked")
            throw std::runtime_error("unknown model: " + model);

        const auto gap = ap.get<int>("--gap");
        if (ap.get<bool>("--score-only") && ap.get<bool>("--structure"))
            throw std::runtime_error("--score-only and --structure are exclusive");

        auto with_structure = model != "weighted";
        if (ap.get<bool>("--score-only")) with_structure = false;
        if (ap.get<bool>("--structure")) with_structure = true;

        ModelParameter param;
        if (!ap.get<std::string>("--param").empty())
            param.load(ap.get<std::string>("--param"));

        auto opts = Fold::Options()
            .min_hairpin_loop_length(gap)
            .bifurcation_traceback(!ap.get<bool>("--no-bifurcation-traceback"));

        const auto fas = Fasta::load(ap.get<std::string>("input"));
        const auto strict = ap.get<bool>("--strict");
        const auto verbose = ap.get<bool>("--verbose");

        std::ofstream ofs;
        const auto output = ap.get<std::string>("--output");
        if (output != "-")
        {
            ofs.open(output);
            if (!ofs)
                throw std::runtime_error("cannot open " + output);
        }
        std::ostream& os = output != "-" ? ofs : std::cout;

        if (model == "stacked")
        {
            const auto conf = param.stacking() ? *param.stacking() : StackingTable::uniform();
            fold_all<StackedPairScore>(fas, conf, opts, strict, with_structure, "total score", verbose, os);
        }
        else
        {
            auto conf = model == "weighted" ? PairTable::weighted() : PairTable::canonical();
            if (param.pair_table())
                conf = *param.pair_table();
            const auto label = model == "flat" ? "max count of pairs"s : "total score"s;
            fold_all<BasePairScore>(fas, conf, opts, strict, with_structure, label, verbose, os);
        }
    } catch (std::exception& err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }

    return 0;
}
