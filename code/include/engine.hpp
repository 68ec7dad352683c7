#pragma once
#include "types.hpp"
#include "rules.hpp"
#include "layers.hpp"
#include "frozen.hpp"
#include "metrics.hpp"
#include <functional>
#include <vector>

enum EngineState {
  INIT = 0,
  RUNNING,
  FINALIZED,
  ABORTED
};

const char* engine_state_name(EngineState s);

struct OutputMap {
  MPoly  parts[3];            // indexed by Category, pairwise disjoint
  double aoi_area = 0;
  double coverage_error = 0;  // |sum of part areas - aoi_area|

  const MPoly& operator[](Category c) const { return parts[c]; }
  double area(Category c) const;
};

// Ordered-step overlay: runs the rule table once, strictly in order, freezing
// whatever each step claims before the next one starts.
class Engine {
public:
  // Throws EmptyAreaOfInterestError, GeometryError (unrepairable AOI), StepOrderError.
  Engine(const MPoly& aoi, const RuleTable& rules, const LayerSource& layers, const Config& cfg);

  // Continue from a replayed store; only before the first step.
  void resume(FrozenStore store, size_t next_step);

  // Runs the next step; false when every step has run.
  // A fatal error moves the engine to ABORTED and propagates; diagnostics stay readable.
  bool step();
  OutputMap run();
  OutputMap finalize();

  EngineState state() const { return state_; }
  size_t next_step() const { return next_; }
  size_t step_count() const { return rules_.steps.size(); }
  const RuleTable& rules() const { return rules_; }
  const MPoly& aoi() const { return aoi_; }
  double aoi_area() const { return aoi_area_; }
  const FrozenStore& store() const { return store_; }
  const std::vector<StepDiag>& diagnostics() const { return diags_; }
  const std::vector<FeatureRecord>& records() const { return records_; }
  const std::vector<Warning>& final_warnings() const { return final_warnings_; }

  // Called after every completed step (checkpointing lives outside the engine).
  // An exception from the hook aborts the run like a failed step.
  std::function<void(const Engine&)> after_step;

private:
  struct Slot;

  MPoly              aoi_;
  double             aoi_area_ = 0;
  RuleTable          rules_;
  const LayerSource* layers_ = nullptr;
  Config             cfg_;
  FrozenStore        store_;
  EngineState        state_ = INIT;
  size_t             next_ = 0;

  std::vector<StepDiag>      diags_;
  std::vector<FeatureRecord> records_;
  std::vector<Warning>       final_warnings_;

  void run_step(const Step& s, StepDiag& d);
  void prepare(const Step& s, const Feature& f, Slot& out) const;
  void commit_category(const Step& s, Category c, const MPoly& geom,
                       const std::vector<MPoly>& parts, const std::vector<size_t>& recs,
                       StepDiag& d);
};
