// =============================================================================
// vq-tiers - Tranches File Parser
// =============================================================================
// Reads the comma-separated tranches file written by the training step:
//
//   # Variant quality score tranches file
//   # Version number 5
//   targetTruthSensitivity,numKnown,...,minVQSLod,filterName,model,...
//   90.00,...,4.9410,VQSRTrancheSNP0.00to90.00,SNP,...
//
// Required columns: targetTruthSensitivity, minVQSLod, filterName.
// Optional column: model (defaults to SNP). Other columns are ignored.
// =============================================================================

#ifndef VQT_IO_TRANCHE_PARSER_H
#define VQT_IO_TRANCHE_PARSER_H

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "vqt/tier/threshold_table.h"

namespace vqt::io {

/// @brief Parse tranches from a stream, in file order.
/// @param sourceName Name used in error messages
/// @throws FormatError on a missing column or malformed row.
[[nodiscard]] std::vector<tier::Tranche> readTranches(std::istream& input,
                                                      const std::string& sourceName);

/// @brief Parse a tranches file, possibly compressed.
/// @throws IOError if the file cannot be opened.
/// @throws FormatError on a missing column or malformed row.
[[nodiscard]] std::vector<tier::Tranche> readTranchesFile(const std::filesystem::path& path);

}  // namespace vqt::io

#endif  // VQT_IO_TRANCHE_PARSER_H
