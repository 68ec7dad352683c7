#include "engine.hpp"
#include "geom.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#ifdef _OPENMP
#include <omp.h>
#endif

const char* engine_state_name(EngineState s){
  switch(s){
    case INIT: return "INIT";
    case RUNNING: return "RUNNING";
    case FINALIZED: return "FINALIZED";
    case ABORTED: return "ABORTED";
  }
  return "?";
}

double OutputMap::area(Category c) const{
  return area_of(parts[c]);
}

// Result of preparing one feature; written by exactly one worker.
struct Engine::Slot {
  FeatureStatus status = F_INVALID;
  Category cat = UNASSIGNED;
  MPoly rest;               // remainder after earlier steps
  double input_area = 0;
  double claimed = 0;
  double sliver = 0;
  std::string why;
};

Engine::Engine(const MPoly& aoi, const RuleTable& rules, const LayerSource& layers, const Config& cfg)
  : aoi_(aoi), rules_(rules), layers_(&layers), cfg_(cfg){
  std::string why;
  if(!repair(aoi_, &why)) throw GeometryError("area of interest is invalid: " + why);
  aoi_area_ = area_of(aoi_);
  if(aoi_.empty() || !(aoi_area_ > 0))
    throw EmptyAreaOfInterestError("area of interest has no area");
  validate_rules(rules_);
  store_ = FrozenStore(cfg_.sliver_ratio * aoi_area_);
  if(cfg_.verbose){
    std::cerr << "[engine] AOI area " << aoi_area_ << ", " << rules_.steps.size()
              << " steps, sliver tolerance " << store_.sliver_tol() << "\n";
  }
}

void Engine::resume(FrozenStore store, size_t next_step){
  if(state_!=INIT) throw EngineStateError(std::string("resume in state ") + engine_state_name(state_));
  if(store.sealed()) throw EngineStateError("resume from a finalized store");
  if(next_step > rules_.steps.size())
    throw StepOrderError("checkpoint resumes at step index " + std::to_string(next_step) +
                         " but the rule table has " + std::to_string(rules_.steps.size()) + " steps");
  if(next_step < rules_.steps.size()){
    int limit = rules_.steps[next_step].id;
    for(const auto& e : store.log())
      if(e.step_id >= limit)
        throw StepOrderError("checkpoint holds step " + std::to_string(e.step_id) +
                             " which has not run before step " + std::to_string(limit));
  }
  store_ = std::move(store);
  next_ = next_step;
  state_ = RUNNING;
  if(cfg_.verbose)
    std::cerr << "[engine] resumed at step index " << next_ << " (" << store_.log().size()
              << " log entries replayed)\n";
}

bool Engine::step(){
  if(state_==FINALIZED || state_==ABORTED)
    throw EngineStateError(std::string("step in terminal state ") + engine_state_name(state_));
  if(next_ >= rules_.steps.size()) return false;
  state_ = RUNNING;

  const Step& s = rules_.steps[next_];
  diags_.emplace_back();
  StepDiag& d = diags_.back();
  d.step_id = s.id;
  d.layer = s.layer;
  try {
    run_step(s, d);
  } catch(...){
    state_ = ABORTED;
    throw;
  }
  d.committed_after[PUBLIC] = store_.area(PUBLIC);
  d.committed_after[PRIVATE] = store_.area(PRIVATE);
  ++next_;

  if(cfg_.verbose){
    print_step_summary(d);
    for(const auto& w : d.warnings) print_warning(w);
  }
  if(after_step){
    try {
      after_step(*this);
    } catch(...){
      state_ = ABORTED;
      throw;
    }
  }
  return true;
}

OutputMap Engine::run(){
  while(step()) {}
  return finalize();
}

void Engine::prepare(const Step& s, const Feature& f, Slot& out) const{
  out.input_area = footprint_area(f.geom);
  auto c = resolve(s, f);
  if(!c){
    out.status = F_NO_MATCH;
    std::string v = source_value(s, f);
    out.why = v.empty() ? "no value for '" + s.mapping.attr + "'"
                        : "value '" + v + "' has no category";
    return;
  }
  out.cat = *c;
  if(f.geom.empty()){
    out.why = "null geometry";
    return;
  }
  MPoly g = f.geom;
  std::string why;
  if(!repair(g, &why)){
    out.why = "invalid after repair: " + why;
    return;
  }
  if(g.empty()){
    out.why = "zero-area geometry";
    return;
  }
  const double tol = store_.sliver_tol();
  try {
    out.rest = subtract(g, store_.decided_near(envelope_of(g)));
  } catch(const bg::exception& e){
    out.why = std::string("subtraction failed: ") + e.what();
    return;
  }
  if(!repair(out.rest, &why)){
    out.rest.clear();
    out.why = "remainder invalid after repair: " + why;
    return;
  }
  out.sliver = drop_slivers(out.rest, tol);
  double a = area_of(out.rest);
  if(!out.rest.empty() && a < tol){
    out.sliver += a;
    out.rest.clear();
    a = 0;
  }
  out.claimed = a;
  out.status = out.rest.empty() ? F_PREEMPTED : F_COMMITTED;
}

void Engine::commit_category(const Step& s, Category c, const MPoly& geom,
                             const std::vector<MPoly>& parts, const std::vector<size_t>& recs,
                             StepDiag& d){
  if(parts.empty()) return;
  double sl = 0;
  if(!cfg_.per_feature_commits && !geom.empty()){
    std::vector<std::string> ids;
    for(size_t r : recs) ids.push_back(records_[r].feature_id);
    try {
      MPoly delta = store_.commit(s.id, c, geom, ids, &sl);
      d.sliver_area += sl;
      d.area_by_cat[c] += area_of(delta);
      return;
    } catch(const GeometryError& e){
      if(cfg_.verbose)
        std::cerr << "[step " << s.id << "] " << category_name(c)
                  << " union rejected (" << e.what() << "), committing per feature\n";
    }
  }
  // one commit per feature; parts already exclude any same-step overlap they lost
  for(size_t i=0;i<parts.size();++i){
    FeatureRecord& r = records_[recs[i]];
    if(parts[i].empty()) continue;
    try {
      MPoly delta = store_.commit(s.id, c, parts[i], {r.feature_id}, &sl);
      d.sliver_area += sl;
      d.area_by_cat[c] += area_of(delta);
      r.claimed_area = area_of(delta);
      if(delta.empty()){
        r.status = F_PREEMPTED;
        d.features_preempted++;
      }
      r.geom = std::move(delta);
    } catch(const GeometryError& e){
      Warning w;
      w.kind = W_GEOMETRY; w.step_id = s.id; w.layer = s.layer;
      w.feature_id = r.feature_id; w.area = area_of(parts[i]);
      w.message = e.what();
      d.warnings.push_back(w);
      d.features_invalid++;
      r.status = F_INVALID;
      r.claimed_area = 0;
      r.geom.clear();
    }
  }
}

void Engine::run_step(const Step& s, StepDiag& d){
  if(!layers_->has_layer(s.layer)){
    if(!s.optional)
      throw LayerUnavailableError("step " + std::to_string(s.id) + ": layer '" + s.layer + "' is not available");
    Warning w;
    w.kind = W_LAYER_MISSING; w.step_id = s.id; w.layer = s.layer;
    w.message = "optional layer not supplied, step skipped";
    d.warnings.push_back(w);
    return;
  }
  const std::vector<Feature>& feats = layers_->features(s.layer);
  d.features_seen = (int)feats.size();

  std::vector<size_t> picked;
  for(size_t i=0;i<feats.size();++i)
    if(filter_matches(s.filter, feats[i])) picked.push_back(i);
  d.features_processed = (int)picked.size();

  // per-feature work is independent; the frozen store is only read here
  std::vector<Slot> slots(picked.size());
  const int threads = std::max(1, cfg_.threads);
  #pragma omp parallel for schedule(dynamic, 4) if(threads > 1) num_threads(threads)
  for(long k=0;k<(long)picked.size();++k){
    prepare(s, feats[picked[k]], slots[k]);
  }

  std::vector<MPoly> by_cat[kFrozenCategories];
  std::vector<size_t> recs[kFrozenCategories];     // records_ slot of each part
  for(size_t k=0;k<picked.size();++k){
    const Feature& f = feats[picked[k]];
    Slot& sl = slots[k];

    FeatureRecord r;
    r.step_id = s.id; r.layer = s.layer; r.source = s.source;
    r.feature_id = f.id; r.reason = s.reason;
    r.source_value = source_value(s, f);
    r.cat = sl.cat; r.status = sl.status; r.claimed_area = sl.claimed;
    if(sl.status==F_COMMITTED) r.geom = sl.rest;
    records_.push_back(r);

    d.sliver_area += sl.sliver;
    switch(sl.status){
      case F_NO_MATCH: {
        d.features_no_match++;
        Warning w;
        w.kind = W_NO_MATCH; w.step_id = s.id; w.layer = s.layer;
        w.feature_id = f.id; w.area = sl.input_area; w.message = sl.why;
        d.warnings.push_back(w);
        if(cfg_.abort_on_no_match)
          throw UnknownCategoryError("step " + std::to_string(s.id) + ", feature " + f.id + ": " + sl.why);
        break;
      }
      case F_INVALID: {
        d.features_invalid++;
        Warning w;
        w.kind = W_GEOMETRY; w.step_id = s.id; w.layer = s.layer;
        w.feature_id = f.id; w.area = sl.input_area; w.message = sl.why;
        d.warnings.push_back(w);
        break;
      }
      case F_PREEMPTED:
        d.features_preempted++;
        break;
      case F_COMMITTED:
        by_cat[sl.cat].push_back(std::move(sl.rest));
        recs[sl.cat].push_back(records_.size() - 1);
        break;
    }
  }

  MPoly merged[kFrozenCategories];
  for(int c=0;c<kFrozenCategories;++c)
    merged[c] = union_all(by_cat[c], threads);

  // commit order only matters for an overlap the precedence list settles
  std::vector<Category> order;
  for(Category c : s.precedence)
    if(std::find(order.begin(), order.end(), c)==order.end()) order.push_back(c);
  for(Category c : {PUBLIC, PRIVATE})
    if(std::find(order.begin(), order.end(), c)==order.end()) order.push_back(c);

  MPoly overlap = intersect(merged[PUBLIC], merged[PRIVATE]);
  double oa = area_of(overlap);
  if(oa > store_.sliver_tol()){
    d.conflict_area = oa;
    Warning w;
    w.kind = W_CONFLICT; w.step_id = s.id; w.layer = s.layer; w.area = oa;
    if(s.precedence.empty()){
      w.message = "features of one step overlap with different categories; overlap left undecided";
    }else{
      w.message = std::string("features of one step overlap with different categories; precedence gives it to ") +
                  category_name(order.front());
    }
    d.warnings.push_back(w);

    // every category but the precedence winner gives the overlap up, part by part
    for(Category c : {PUBLIC, PRIVATE}){
      if(!s.precedence.empty() && c==order.front()) continue;
      merged[c] = subtract(merged[c], overlap);
      for(size_t i=0;i<by_cat[c].size();++i){
        FeatureRecord& r = records_[recs[c][i]];
        MPoly& part = by_cat[c][i];
        try {
          part = subtract(part, overlap);
        } catch(const bg::exception& e){
          Warning g;
          g.kind = W_GEOMETRY; g.step_id = s.id; g.layer = s.layer;
          g.feature_id = r.feature_id; g.area = area_of(part);
          g.message = std::string("conflict subtraction failed: ") + e.what();
          d.warnings.push_back(g);
          d.features_invalid++;
          part.clear();
          r.status = F_INVALID;
        }
        d.sliver_area += drop_slivers(part, store_.sliver_tol());
        if(part.empty() && r.status==F_COMMITTED){
          r.status = F_PREEMPTED;
          d.features_preempted++;
        }
        r.claimed_area = area_of(part);
        r.geom = part;
      }
    }
  }

  for(Category c : order)
    commit_category(s, c, merged[c], by_cat[c], recs[c], d);
  d.area_assigned = d.area_by_cat[PUBLIC] + d.area_by_cat[PRIVATE];
}

OutputMap Engine::finalize(){
  if(state_==FINALIZED) throw EngineStateError("engine already finalized");
  if(state_==ABORTED) throw EngineStateError("run aborted; construct a new engine to re-run");
  if(next_ < rules_.steps.size())
    throw EngineStateError("finalize before step " + std::to_string(rules_.steps[next_].id) + " has run");
  store_.seal();
  state_ = FINALIZED;

  OutputMap out;
  out.aoi_area = aoi_area_;
  out.parts[PUBLIC] = store_.region(PUBLIC);
  out.parts[PRIVATE] = store_.region(PRIVATE);
  out.parts[UNASSIGNED] = subtract(aoi_, store_.already_decided());

  double sum = 0;
  for(Category c : {PUBLIC, PRIVATE, UNASSIGNED}){
    std::string why;
    if(!repair(out.parts[c], &why)){
      Warning w;
      w.kind = W_GEOMETRY; w.area = area_of(out.parts[c]);
      w.message = std::string(category_name(c)) + " output invalid: " + why;
      final_warnings_.push_back(w);
    }
    sum += area_of(out.parts[c]);
  }
  out.coverage_error = std::abs(sum - aoi_area_);
  if(out.coverage_error > cfg_.coverage_ratio * aoi_area_){
    Warning w;
    w.kind = W_COVERAGE; w.area = out.coverage_error;
    w.message = "output parts do not add up to the area of interest";
    final_warnings_.push_back(w);
  }
  if(cfg_.verbose){
    std::cerr << "[finalize] public=" << out.area(PUBLIC) << " private=" << out.area(PRIVATE)
              << " unassigned=" << out.area(UNASSIGNED) << " coverage_error=" << out.coverage_error << "\n";
    for(const auto& w : final_warnings_) print_warning(w);
  }
  return out;
}
