#pragma once
#include "types.hpp"
#include "engine.hpp"
#include "frozen.hpp"
#include "metrics.hpp"
#include <string>
#include <vector>

// Output: grouped by category, one polygon per line as WKT.
void write_result(const OutputMap& out, const std::string& out_path);

void write_diagnostics(const std::vector<StepDiag>& diags, const std::vector<Warning>& extra,
                       const std::string& out_path);

// Tab separated: step, layer, source, feature, category, status, claimed area, value, reason,
// and the feature's committed share as WKT.
void write_records(const std::vector<FeatureRecord>& records, const std::string& out_path);

// Commit log plus the index of the next step to run; written to a temp file, then renamed.
void save_checkpoint(const FrozenStore& store, size_t next_step, const std::string& path);
// Replays the saved log into `into` (a fresh store) and returns the next step index.
size_t load_checkpoint(const std::string& path, FrozenStore& into);
