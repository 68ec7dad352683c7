#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/box.hpp>

namespace bg = boost::geometry;

using i32 = int32_t; using u32 = uint32_t; using u64 = uint64_t;

using Point = bg::model::d2::point_xy<double>;
using Poly  = bg::model::polygon<Point>;        // clockwise, closed
using MPoly = bg::model::multi_polygon<Poly>;
using Box   = bg::model::box<Point>;

enum Category : uint8_t {
  PUBLIC = 0,
  PRIVATE = 1,
  UNASSIGNED = 2
};
constexpr int kFrozenCategories = 2;   // PUBLIC, PRIVATE

const char* category_name(Category c);
bool parse_category(const std::string& s, Category& out); // PUBLIC / PRIVATE only

using AttrMap = std::unordered_map<std::string, std::string>;

struct Feature {
  std::string id;            // source identifier, or "<layer>#<index>"
  std::string layer;
  MPoly       geom;          // may be invalid or empty
  AttrMap     attrs;
};

struct Config {
  int threads = 1;
  double sliver_ratio = 1e-6;     // sliver tolerance = ratio * AOI area
  double coverage_ratio = 1e-6;   // allowed |sum of parts - AOI| / AOI
  bool abort_on_no_match = false;
  bool per_feature_commits = false;  // one log entry per feature instead of per step and category
  std::string id_attribute = "lokaal_id";
  std::string checkpoint_path;    // empty: no checkpoints
  bool verbose = true;
};
