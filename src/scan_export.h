#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "contract.h"

namespace claimscan::anomaly {

// Columns: rank,entity_id,score,num_flags,flag_kinds. Kinds are the distinct
// kinds of a result in canonical order, joined by ';'.
auto WriteScanResultsCsv(std::ostream& out, const std::vector<ScanResult>& results) -> void;

// Writes the CSV to `path`, creating parent directories. Throws std::runtime_error on I/O failure.
auto WriteScanResultsCsvFile(const std::string& path, const std::vector<ScanResult>& results) -> void;

auto JoinFlagKinds(const ScanResult& result, const std::string& separator) -> std::string;

} // namespace claimscan::anomaly
