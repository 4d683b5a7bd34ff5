#pragma once

#include "sequence_analyzer.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace omorifit {

// One line per candidate, e.g. "M7.8 ... 412 aftershocks p=1.08 R²=0.94 [success]"
void printSequenceLine(std::ostream& os, const SequenceResult& result);

// Counts, p and R² statistics, original vs modified model, p-M trend
void printSummary(std::ostream& os, const SequenceSummary& summary);

// Per-candidate results table; false if the file cannot be written
bool writeResultsCsv(const std::string& filename, const std::vector<SequenceResult>& results);
void writeResultsCsv(std::ostream& os, const std::vector<SequenceResult>& results);

} // namespace omorifit
