#pragma once

#include <istream>
#include <optional>
#include <string>
#include "param/bpscore.h"
#include "param/stacking.h"

// Pair and stacking tables read from a sectioned parameter file:
//
//   ## comment
//   # pair
//   A U 2
//   # stack
//   <6 rows of 6 scores, order AU UA GC CG GU UG>
//   # END
class ModelParameter
{
    public:
        ModelParameter() : pair_table_(), stacking_() { }

        void load(const char* filename);
        void load(const std::string& filename) { load(filename.c_str()); }
        void read(std::istream& is);

        const std::optional<PairTable>& pair_table() const { return pair_table_; }
        const std::optional<StackingTable>& stacking() const { return stacking_; }

    private:
        std::optional<PairTable> pair_table_;
        std::optional<StackingTable> stacking_;
};
