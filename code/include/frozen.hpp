#pragma once
#include "types.hpp"
#include <boost/geometry/index/rtree.hpp>
#include <string>
#include <utility>
#include <vector>

namespace bgi = boost::geometry::index;

// One committed delta; the store is exactly the ordered replay of these.
struct LogEntry {
  int step_id = 0;
  Category cat = PUBLIC;
  MPoly delta;
  double area = 0;
  std::vector<std::string> sources;   // contributing feature ids
};

// Per-category union of everything committed so far. Grows only; a point that
// has been committed is never handed to another commit.
class FrozenStore {
public:
  explicit FrozenStore(double sliver_tol=0.0) : sliver_tol_(sliver_tol) {}

  MPoly already_decided() const;
  // Union of the committed pieces whose envelope intersects bb.
  MPoly decided_near(const Box& bb) const;

  // Subtracts the decided area, repairs and sliver-filters the rest, then adds it
  // to c. Returns the newly added geometry (empty when fully pre-empted).
  // Throws EngineStateError once sealed, GeometryError on unrepairable geometry.
  MPoly commit(int step_id, Category c, const MPoly& g,
               const std::vector<std::string>& sources = {},
               double* sliver_area = nullptr);

  void replay(const LogEntry& e);

  void seal(){ sealed_ = true; }
  bool sealed() const { return sealed_; }

  const MPoly& region(Category c) const;
  double area(Category c) const;
  double decided_area() const { return areas_[PUBLIC] + areas_[PRIVATE]; }
  double sliver_tol() const { return sliver_tol_; }
  const std::vector<LogEntry>& log() const { return log_; }

private:
  using IndexValue = std::pair<Box, size_t>;

  double sliver_tol_;
  MPoly  regions_[kFrozenCategories];
  double areas_[kFrozenCategories] = {0.0, 0.0};
  std::vector<Poly> pieces_;                        // every committed part
  bgi::rtree<IndexValue, bgi::rstar<16>> index_;    // envelope -> pieces_ slot
  std::vector<LogEntry> log_;
  bool sealed_ = false;

  void check_category(Category c) const;
  void absorb(Category c, const MPoly& delta);
};
