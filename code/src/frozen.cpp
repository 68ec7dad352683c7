#include "frozen.hpp"
#include "geom.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iterator>

void FrozenStore::check_category(Category c) const{
  if(c!=PUBLIC && c!=PRIVATE)
    throw std::invalid_argument(std::string("cannot commit geometry to ") + category_name(c));
}

MPoly FrozenStore::already_decided() const{
  return union_all({regions_[PUBLIC], regions_[PRIVATE]});
}

MPoly FrozenStore::decided_near(const Box& bb) const{
  std::vector<IndexValue> hits;
  index_.query(bgi::intersects(bb), std::back_inserter(hits));
  if(hits.empty()) return MPoly();
  // slot order keeps the reduce independent of rtree traversal order
  std::sort(hits.begin(), hits.end(), [](const IndexValue& a, const IndexValue& b){
    return a.second < b.second;
  });
  std::vector<MPoly> parts; parts.reserve(hits.size());
  for(const auto& h : hits) parts.push_back(to_mpoly(pieces_[h.second]));
  return union_all(std::move(parts));
}

const MPoly& FrozenStore::region(Category c) const{
  check_category(c);
  return regions_[c];
}

double FrozenStore::area(Category c) const{
  check_category(c);
  return areas_[c];
}

void FrozenStore::absorb(Category c, const MPoly& delta){
  regions_[c] = unite(regions_[c], delta);
  areas_[c] += area_of(delta);
  for(const auto& p : delta){
    size_t slot = pieces_.size();
    pieces_.push_back(p);
    index_.insert(IndexValue(bg::return_envelope<Box>(p), slot));
  }
}

MPoly FrozenStore::commit(int step_id, Category c, const MPoly& g,
                          const std::vector<std::string>& sources, double* sliver_area){
  if(sealed_) throw EngineStateError("commit on a finalized store (step " + std::to_string(step_id) + ")");
  check_category(c);
  if(sliver_area) *sliver_area = 0;

  MPoly in = g;
  std::string why;
  if(!repair(in, &why)) throw GeometryError("commit input invalid: " + why);
  if(in.empty()) return MPoly();

  MPoly rest;
  try {
    rest = subtract(in, decided_near(envelope_of(in)));
  } catch(const bg::exception& e){
    throw GeometryError(std::string("subtraction failed: ") + e.what());
  }
  if(!repair(rest, &why)) throw GeometryError("remainder invalid after subtraction: " + why);

  double dropped = drop_slivers(rest, sliver_tol_);
  double a = area_of(rest);
  if(!rest.empty() && a < sliver_tol_){
    dropped += a;
    rest.clear();
  }
  if(sliver_area) *sliver_area = dropped;
  if(rest.empty()) return rest;

  absorb(c, rest);
  LogEntry e;
  e.step_id = step_id;
  e.cat = c;
  e.delta = rest;
  e.area = a;
  e.sources = sources;
  log_.push_back(std::move(e));
  return rest;
}

void FrozenStore::replay(const LogEntry& e){
  if(sealed_) throw EngineStateError("replay on a finalized store");
  check_category(e.cat);
  if(!log_.empty() && e.step_id < log_.back().step_id)
    throw StepOrderError("log entry for step " + std::to_string(e.step_id) +
                         " replayed after step " + std::to_string(log_.back().step_id));
  absorb(e.cat, e.delta);
  log_.push_back(e);
}
