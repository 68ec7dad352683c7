#pragma once
#include "types.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

// Diagnostics dashboard: what every step did, and everything it had to skip.

enum WarningKind {
  W_GEOMETRY = 0,     // invalid after repair, or null geometry
  W_NO_MATCH,         // attribute value absent from the step's mapping
  W_CONFLICT,         // same-step overlap between categories
  W_LAYER_MISSING,    // optional layer not supplied
  W_COVERAGE          // output parts do not add up to the AOI
};

inline const char* warning_kind_name(WarningKind k){
  switch(k){
    case W_GEOMETRY: return "GEOMETRY";
    case W_NO_MATCH: return "NO_MATCH";
    case W_CONFLICT: return "CONFLICT";
    case W_LAYER_MISSING: return "LAYER_MISSING";
    case W_COVERAGE: return "COVERAGE";
  }
  return "?";
}

struct Warning {
  WarningKind kind = W_GEOMETRY;
  int step_id = -1;
  std::string layer;
  std::string feature_id;   // geometry reference
  double area = 0;          // area that did not get classified by this feature
  std::string message;
};

struct StepDiag {
  int step_id = 0;
  std::string layer;
  int features_seen = 0;         // in the layer
  int features_processed = 0;    // passed the filter
  int features_preempted = 0;    // nothing left after earlier steps
  int features_no_match = 0;
  int features_invalid = 0;
  double area_assigned = 0;
  double area_by_cat[kFrozenCategories] = {0.0, 0.0};
  double committed_after[kFrozenCategories] = {0.0, 0.0};
  double sliver_area = 0;
  double conflict_area = 0;
  std::vector<Warning> warnings;
};

enum FeatureStatus {
  F_COMMITTED = 0,
  F_PREEMPTED,
  F_NO_MATCH,
  F_INVALID
};

inline const char* feature_status_name(FeatureStatus s){
  switch(s){
    case F_COMMITTED: return "COMMITTED";
    case F_PREEMPTED: return "PREEMPTED";
    case F_NO_MATCH: return "NO_MATCH";
    case F_INVALID: return "INVALID";
  }
  return "?";
}

// Per-feature provenance, one line per processed feature.
struct FeatureRecord {
  int step_id = 0;
  std::string layer;
  std::string source;
  std::string feature_id;
  std::string reason;
  std::string source_value;
  Category cat = UNASSIGNED;
  FeatureStatus status = F_COMMITTED;
  double claimed_area = 0;       // remainder after earlier steps and same-step conflicts
  MPoly geom;                    // that remainder; empty unless committed
};

inline void print_step_summary(const StepDiag& d, std::ostream& os = std::cerr){
  os << "[step " << d.step_id << "] " << d.layer
     << ": seen=" << d.features_seen
     << ", processed=" << d.features_processed
     << ", preempted=" << d.features_preempted
     << ", no_match=" << d.features_no_match
     << ", invalid=" << d.features_invalid
     << ", assigned=" << std::fixed << std::setprecision(3) << d.area_assigned
     << " (public=" << d.area_by_cat[PUBLIC] << ", private=" << d.area_by_cat[PRIVATE] << ")";
  if(d.sliver_area > 0) os << ", slivers=" << d.sliver_area;
  if(d.conflict_area > 0) os << ", conflict=" << d.conflict_area;
  os << std::defaultfloat << "\n";
}

inline void print_warning(const Warning& w, std::ostream& os = std::cerr){
  os << "  [" << warning_kind_name(w.kind) << "]";
  if(w.step_id >= 0) os << " step " << w.step_id;
  if(!w.layer.empty()) os << " layer " << w.layer;
  if(!w.feature_id.empty()) os << " feature " << w.feature_id;
  os << " area=" << w.area << ": " << w.message << "\n";
}

inline void print_run_summary(const std::vector<StepDiag>& diags, std::ostream& os = std::cerr){
  os << "\n========================================\n";
  os << "  Classification summary\n";
  os << "========================================\n";
  os << "  step  layer                     proc  pre   nomatch invalid  assigned\n";
  os << "  ----------------------------------------------------------------------\n";
  int proc=0, pre=0, nm=0, inv=0; double assigned=0;
  size_t warnings=0;
  for(const auto& d : diags){
    os << "  " << std::left << std::setw(6) << d.step_id
       << std::setw(26) << d.layer
       << std::right << std::setw(5) << d.features_processed
       << std::setw(6) << d.features_preempted
       << std::setw(8) << d.features_no_match
       << std::setw(8) << d.features_invalid
       << std::setw(12) << std::fixed << std::setprecision(2) << d.area_assigned
       << std::defaultfloat << "\n";
    proc += d.features_processed; pre += d.features_preempted;
    nm += d.features_no_match; inv += d.features_invalid;
    assigned += d.area_assigned; warnings += d.warnings.size();
  }
  os << "  ----------------------------------------------------------------------\n";
  os << "  Total " << std::setw(26) << "" << std::right << std::setw(5) << proc
     << std::setw(6) << pre << std::setw(8) << nm << std::setw(8) << inv
     << std::setw(12) << std::fixed << std::setprecision(2) << assigned
     << std::defaultfloat << "\n";
  os << "  Warnings: " << warnings << "\n";
}
