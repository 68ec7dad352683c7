#pragma once
#include "types.hpp"
#include "rules.hpp"
#include "layers.hpp"
#include "metrics.hpp"
#include <istream>
#include <string>
#include <vector>

// Rule table: validated on load (StepOrderError / std::runtime_error with line numbers).
RuleTable parse_rule_file(const std::string& rule_path);
RuleTable parse_rule_stream(std::istream& in, const std::string& name);

// Layer file: "Layer <name>" headers, then "<WKT> | key=value | ..." per feature.
// Non-polygonal or malformed geometry is rejected into `rejected`, never loaded.
void parse_layer_file(const std::string& layer_path, MemoryLayers& into, const Config& cfg,
                      std::vector<Warning>& rejected);
void parse_layer_stream(std::istream& in, const std::string& name, MemoryLayers& into,
                        const Config& cfg, std::vector<Warning>& rejected);

// AOI file: one polygonal WKT per line, unioned. Throws GeometryError.
MPoly parse_aoi_file(const std::string& aoi_path);
MPoly parse_aoi_stream(std::istream& in, const std::string& name);

// Polygon / multipolygon WKT; "... EMPTY" gives an empty geometry.
// Throws GeometryError for any other geometry kind or malformed text.
MPoly read_polygonal_wkt(const std::string& wkt);
