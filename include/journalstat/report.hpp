#pragma once

#include <ostream>
#include <string>

#include "journalstat/analysis.hpp"

namespace journalstat {

void print_table(const AnalysisResult& result, std::ostream& out);
void print_json(const AnalysisResult& result, std::ostream& out);

std::string escape_json_string(const std::string& value);

}  // namespace journalstat
