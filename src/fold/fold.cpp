#include <stack>
#include <stdexcept>
#include "fold.h"

//static
auto
Fold::
make_paren(const std::vector<Pair>& p, size_t L) -> std::string
{
    std::string s(L, UNPAIRED);
    for (const auto& [k, j] : p)
    {
        s[k] = OPEN;
        s[j] = CLOSE;
    }
    return s;
}

// A stacked pair (k, j) covers the dinucleotides k,k+1 and j,j+1.
// The opening side only claims k+1 while it is still unpaired, the
// closing side always takes j+1.
//static
auto
Fold::
make_stacked_paren(const std::vector<Pair>& p, size_t L) -> std::string
{
    std::string s(L, UNPAIRED);
    for (const auto& [k, j] : p)
    {
        s[k] = OPEN;
        if (k+1 < L && s[k+1] == UNPAIRED)
            s[k+1] = OPEN;
        if (s[j] == UNPAIRED)
            s[j] = CLOSE;
        if (j+1 < L)
            s[j+1] = CLOSE;
    }
    return s;
}

//static
auto
Fold::
parse_paren(const std::string& paren) -> std::vector<Pair>
{
    std::vector<Pair> p;
    std::stack<u_int32_t> st;
    for (u_int32_t i=0; i!=paren.size(); ++i)
    {
        switch (paren[i])
        {
            case OPEN:
                st.push(i);
                break;
            case CLOSE:
                if (st.empty())
                    throw std::runtime_error("unbalanced '" + std::string(1, CLOSE) + "' at position " + std::to_string(i+1));
                p.emplace_back(st.top(), i);
                st.pop();
                break;
            default:
                break;
        }
    }
    if (!st.empty())
        throw std::runtime_error("unbalanced '" + std::string(1, OPEN) + "' at position " + std::to_string(st.top()+1));
    return p;
}

//static
void
Fold::
validate_sequence(const std::string& seq)
{
    for (size_t i=0; i!=seq.size(); ++i)
    {
        switch (seq[i])
        {
            case 'A': case 'C': case 'G': case 'U':
                break;
            default:
                throw std::invalid_argument("invalid nucleotide '" + std::string(1, seq[i])
                    + "' at position " + std::to_string(i+1));
        }
    }
}
