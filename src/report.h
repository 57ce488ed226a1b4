#pragma once

#include <optional>
#include <ostream>
#include <string>

// Results file layout:
//   > SEQUENCE            (annotated mode only)
//   ANNOTATION            (annotated mode only)
//   > LABEL
//   SCORE
void write_report(std::ostream& os, const std::string& seq, long score,
                const std::optional<std::string>& structure, const std::string& score_label);
