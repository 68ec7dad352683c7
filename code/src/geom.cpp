#include "geom.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

double area_of(const MPoly& g){
  double a=0;
  for(const auto& p : g) a += std::abs(bg::area(p));
  return a;
}

Box envelope_of(const MPoly& g){
  Box b;
  if(g.empty()){ bg::assign_zero(b); return b; }
  bg::envelope(g, b);
  return b;
}

MPoly to_mpoly(const Poly& p){
  MPoly m; m.push_back(p);
  return m;
}

static void drop_degenerate(MPoly& g){
  for(auto& p : g){
    auto& inners = p.inners();
    inners.erase(std::remove_if(inners.begin(), inners.end(), [](const Poly::ring_type& r){
      return r.size() < 4 || bg::area(r) == 0.0;
    }), inners.end());
  }
  g.erase(std::remove_if(g.begin(), g.end(), [](const Poly& p){
    return p.outer().size() < 4 || bg::area(p.outer()) == 0.0;
  }), g.end());
}

static void buffer_zero(const MPoly& in, MPoly& out){
  bg::strategy::buffer::distance_symmetric<double> dist(0.0);
  bg::strategy::buffer::side_straight side;
  bg::strategy::buffer::join_miter join;
  bg::strategy::buffer::end_flat end;
  bg::strategy::buffer::point_square point;
  bg::buffer(in, out, dist, side, join, end, point);
}

using Ring = Poly::ring_type;
static const double kParamEps = 1e-12;

static bool same_point(const Point& a, const Point& b){
  return a.x()==b.x() && a.y()==b.y();
}

// Inserts every point where the closed ring crosses or touches itself, then cuts
// the noded ring into simple loops at each repeated point. Loop orientation is kept.
static std::vector<Ring> ring_lobes(const Ring& r){
  std::vector<Point> pts(r.begin(), r.end());
  if(pts.size() < 3) return {};
  if(!same_point(pts.front(), pts.back())) pts.push_back(pts.front());
  const size_t n = pts.size() - 1;

  // one computed point is shared by both segments of a crossing
  std::vector<std::vector<std::pair<double, Point>>> cuts(n);
  for(size_t i=0;i<n;++i){
    const Point& a = pts[i];
    const Point& b = pts[i+1];
    double rx = b.x()-a.x(), ry = b.y()-a.y();
    for(size_t j=i+1;j<n;++j){
      const Point& c = pts[j];
      const Point& d = pts[j+1];
      double sx = d.x()-c.x(), sy = d.y()-c.y();
      double qx = c.x()-a.x(), qy = c.y()-a.y();
      double den = rx*sy - ry*sx;
      if(den == 0.0){
        if(qx*ry - qy*rx != 0.0) continue;      // parallel, apart
        double rr = rx*rx + ry*ry, ss = sx*sx + sy*sy;
        if(rr == 0.0 || ss == 0.0) continue;
        for(const Point* p : {&c, &d}){
          double t = ((p->x()-a.x())*rx + (p->y()-a.y())*ry) / rr;
          if(t > kParamEps && t < 1-kParamEps) cuts[i].push_back({t, *p});
        }
        for(const Point* p : {&a, &b}){
          double u = ((p->x()-c.x())*sx + (p->y()-c.y())*sy) / ss;
          if(u > kParamEps && u < 1-kParamEps) cuts[j].push_back({u, *p});
        }
        continue;
      }
      double t = (qx*sy - qy*sx) / den;
      double u = (qx*ry - qy*rx) / den;
      if(t < -kParamEps || t > 1+kParamEps || u < -kParamEps || u > 1+kParamEps) continue;
      bool t_in = t > kParamEps && t < 1-kParamEps;
      bool u_in = u > kParamEps && u < 1-kParamEps;
      if(!t_in && !u_in) continue;             // shared vertex
      Point x = !u_in ? (u < 0.5 ? c : d)
              : !t_in ? (t < 0.5 ? a : b)
              : Point(a.x() + t*rx, a.y() + t*ry);
      if(t_in) cuts[i].push_back({t, x});
      if(u_in) cuts[j].push_back({u, x});
    }
  }

  std::vector<Point> noded;
  for(size_t i=0;i<n;++i){
    noded.push_back(pts[i]);
    auto& cs = cuts[i];
    std::sort(cs.begin(), cs.end(), [](const std::pair<double, Point>& l, const std::pair<double, Point>& r){
      return l.first < r.first;
    });
    for(const auto& c : cs) noded.push_back(c.second);
  }
  noded.push_back(pts[n]);
  noded.erase(std::unique(noded.begin(), noded.end(), same_point), noded.end());

  std::vector<Ring> out;
  std::vector<Point> open;
  std::map<std::pair<double, double>, size_t> seen;   // point -> position in `open`
  for(const Point& p : noded){
    auto key = std::make_pair(p.x(), p.y());
    auto it = seen.find(key);
    if(it == seen.end()){
      seen[key] = open.size();
      open.push_back(p);
      continue;
    }
    size_t k = it->second;
    Ring loop;
    loop.assign(open.begin() + k, open.end());
    loop.push_back(p);
    for(size_t m=k+1;m<open.size();++m) seen.erase(std::make_pair(open[m].x(), open[m].y()));
    open.resize(k+1);
    if(loop.size() >= 4) out.push_back(std::move(loop));
  }
  return out;
}

// Simple loops of a ring as clockwise one-part polygons; zero-area loops dropped.
static std::vector<MPoly> lobe_polys(const Ring& r, double* lobe_sum){
  std::vector<MPoly> out;
  for(auto& loop : ring_lobes(r)){
    Poly p;
    p.outer() = std::move(loop);
    bg::correct(p);
    bg::remove_spikes(p);
    double a = std::abs(bg::area(p));
    if(p.outer().size() < 4 || a == 0.0) continue;
    if(lobe_sum) *lobe_sum += a;
    out.push_back(to_mpoly(p));
  }
  return out;
}

double footprint_area(const MPoly& g){
  double total = 0;
  for(const auto& p : g){
    double outer = 0, holes = 0;
    lobe_polys(p.outer(), &outer);
    for(const auto& r : p.inners()) lobe_polys(r, &holes);
    total += std::max(0.0, outer - holes);
  }
  return total;
}

// Every part rebuilt as union(outer lobes) - union(hole lobes), then all parts unioned.
static MPoly rebuild_from_lobes(const MPoly& g){
  std::vector<MPoly> parts;
  for(const auto& p : g){
    MPoly outer = union_all(lobe_polys(p.outer(), nullptr));
    std::vector<MPoly> holes;
    for(const auto& r : p.inners()){
      auto h = lobe_polys(r, nullptr);
      holes.insert(holes.end(), h.begin(), h.end());
    }
    parts.push_back(subtract(outer, union_all(std::move(holes))));
  }
  return union_all(std::move(parts));
}

bool repair(MPoly& g, std::string* why){
  // open rings (< 3 points) cannot be closed into anything
  g.erase(std::remove_if(g.begin(), g.end(), [](const Poly& p){
    return p.outer().size() < 3;
  }), g.end());
  bg::correct(g);
  bg::unique(g);
  bg::remove_spikes(g);

  std::string msg;
  if(bg::is_valid(g, msg)) return true;

  // self-intersections, zero-area rings and overlapping parts
  double before = footprint_area(g);
  try {
    MPoly rebuilt = rebuild_from_lobes(g);
    drop_degenerate(rebuilt);
    std::string msg2;
    if((rebuilt.empty() && before == 0.0) || (!rebuilt.empty() && bg::is_valid(rebuilt, msg2))){
      g.swap(rebuilt);
      return true;
    }
    msg += " (rebuild: " + (msg2.empty() ? std::string("nothing left") : msg2) + ")";
  } catch(const bg::exception& e){
    msg += std::string(" (rebuild: ") + e.what() + ")";
  }

  MPoly fixed;
  try {
    buffer_zero(g, fixed);
  } catch(const bg::exception& e){
    if(why) *why = msg + " (buffer: " + e.what() + ")";
    return false;
  }
  bg::correct(fixed);
  drop_degenerate(fixed);
  std::string msg3;
  if(!bg::is_valid(fixed, msg3)){
    if(why) *why = msg3;
    return false;
  }
  if(fixed.empty() && before > 0){
    if(why) *why = msg + " (repair collapsed the geometry)";
    return false;
  }
  g.swap(fixed);
  return true;
}

MPoly subtract(const MPoly& a, const MPoly& b){
  if(a.empty() || b.empty()) return a;
  MPoly out;
  bg::difference(a, b, out);
  return out;
}

MPoly unite(const MPoly& a, const MPoly& b){
  if(a.empty()) return b;
  if(b.empty()) return a;
  MPoly out;
  bg::union_(a, b, out);
  return out;
}

MPoly intersect(const MPoly& a, const MPoly& b){
  MPoly out;
  if(a.empty() || b.empty()) return out;
  bg::intersection(a, b, out);
  return out;
}

MPoly union_all(std::vector<MPoly> parts, int threads){
  parts.erase(std::remove_if(parts.begin(), parts.end(), [](const MPoly& m){ return m.empty(); }),
              parts.end());
  if(parts.empty()) return MPoly();
  while(parts.size() > 1){
    size_t pairs = parts.size() / 2;
    std::vector<MPoly> next(pairs + (parts.size() % 2));
    #pragma omp parallel for schedule(dynamic) if(threads > 1 && pairs > 1) num_threads(std::max(1, threads))
    for(long i = 0; i < (long)pairs; ++i){
      next[i] = unite(parts[2*i], parts[2*i+1]);
    }
    if(parts.size() % 2) next.back() = std::move(parts.back());
    parts.swap(next);
  }
  return std::move(parts.front());
}

double drop_slivers(MPoly& g, double tol){
  double dropped = 0;
  g.erase(std::remove_if(g.begin(), g.end(), [&](const Poly& p){
    double a = std::abs(bg::area(p));
    if(a < tol){ dropped += a; return true; }
    return false;
  }), g.end());
  return dropped;
}
