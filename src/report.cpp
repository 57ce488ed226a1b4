#include "report.h"

void
write_report(std::ostream& os, const std::string& seq, long score,
                const std::optional<std::string>& structure, const std::string& score_label)
{
    if (structure)
    {
        os << "> " << seq << std::endl
            << *structure << std::endl
            << "> " << score_label << std::endl;
    }
    else
        os << "> total score" << std::endl;
    os << score << std::endl;
}
