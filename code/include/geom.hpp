#pragma once
#include "types.hpp"
#include <string>
#include <vector>

double area_of(const MPoly& g);            // unsigned, summed over parts
Box    envelope_of(const MPoly& g);
inline bool is_empty_geom(const MPoly& g){ return g.empty(); }

// Canonicalize in place: close rings, fix orientation, drop zero-length segments
// and spikes. Self-intersecting rings are split into their simple loops and the
// loops unioned (overlapping parts dissolve the same way); a zero-distance buffer
// is the last resort. Returns false (with the validity message in *why) when g is
// still invalid.
bool repair(MPoly& g, std::string* why=nullptr);

// Area a feature covers even when invalid: absolute loop areas of the outer rings
// less those of the holes, per part.
double footprint_area(const MPoly& g);

MPoly subtract(const MPoly& a, const MPoly& b);
MPoly unite(const MPoly& a, const MPoly& b);
MPoly intersect(const MPoly& a, const MPoly& b);

// Pairwise (tree) union reduce; pairs of one level may run in parallel.
MPoly union_all(std::vector<MPoly> parts, int threads=1);

// Removes parts whose area is below tol; returns the removed area.
double drop_slivers(MPoly& g, double tol);

MPoly to_mpoly(const Poly& p);
