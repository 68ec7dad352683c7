#pragma once
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

enum FilterOp {
  ANY = 0,     // every feature of the layer
  EQ,
  NE,
  IN,
  NOT_IN
};

struct AttrFilter {
  FilterOp op = ANY;
  std::string attr;
  std::vector<std::string> values;   // EQ/NE use values[0]
};

struct CategoryMapping {
  std::string attr;                          // empty: default applies to all
  std::map<std::string, Category> table;     // attribute value -> category
  std::optional<Category> fallback;          // unknown / missing value
};

struct Step {
  int id = 0;
  std::string layer;
  std::string source;                        // provenance: dataset name
  std::string reason;                        // provenance: free text
  AttrFilter filter;
  CategoryMapping mapping;
  std::vector<Category> precedence;          // same-step tie-break, first wins
  bool optional = false;                     // missing layer is a warning, not fatal
};

struct RuleTable {
  std::vector<Step> steps;
};

// Throws StepOrderError on duplicate / non-monotonic ids,
// std::runtime_error on a step that can never resolve a category.
void validate_rules(const RuleTable& R);

bool filter_matches(const AttrFilter& f, const Feature& ft);

// Category Resolver: nullopt is NoMatch.
std::optional<Category> resolve(const Step& s, const Feature& ft);

// Attribute value used for mapping (empty when absent or unmapped).
std::string source_value(const Step& s, const Feature& ft);

const char* filter_op_name(FilterOp op);
