#include "rules.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <set>

const char* category_name(Category c){
  switch(c){
    case PUBLIC: return "PUBLIC";
    case PRIVATE: return "PRIVATE";
    default: return "UNASSIGNED";
  }
}

bool parse_category(const std::string& s, Category& out){
  std::string u = s;
  std::transform(u.begin(), u.end(), u.begin(), [](unsigned char c){ return (char)std::toupper(c); });
  if(u=="PUBLIC"){ out=PUBLIC; return true; }
  if(u=="PRIVATE"){ out=PRIVATE; return true; }
  return false;
}

const char* filter_op_name(FilterOp op){
  switch(op){
    case ANY: return "any";
    case EQ: return "eq";
    case NE: return "ne";
    case IN: return "in";
    case NOT_IN: return "not_in";
  }
  return "?";
}

void validate_rules(const RuleTable& R){
  std::set<int> seen;
  for(size_t i=0;i<R.steps.size();++i){
    const Step& s = R.steps[i];
    if(!seen.insert(s.id).second)
      throw StepOrderError("duplicate step id " + std::to_string(s.id));
    if(i>0 && s.id <= R.steps[i-1].id)
      throw StepOrderError("step id " + std::to_string(s.id) + " follows " +
                           std::to_string(R.steps[i-1].id) + ": ids must strictly increase");
    if(s.layer.empty())
      throw std::runtime_error("step " + std::to_string(s.id) + " has no source layer");
    if(s.mapping.table.empty() && !s.mapping.fallback)
      throw std::runtime_error("step " + std::to_string(s.id) + " maps no value to a category");
    if((s.filter.op==EQ || s.filter.op==NE) && s.filter.values.size()!=1)
      throw std::runtime_error("step " + std::to_string(s.id) + ": eq/ne filter needs exactly one value");
    if(s.filter.op!=ANY && s.filter.attr.empty())
      throw std::runtime_error("step " + std::to_string(s.id) + ": filter without attribute");
  }
}

bool filter_matches(const AttrFilter& f, const Feature& ft){
  if(f.op==ANY) return true;
  auto it = ft.attrs.find(f.attr);
  // a missing attribute never equals anything, so it passes the negated filters
  if(it==ft.attrs.end()) return f.op==NE || f.op==NOT_IN;
  const std::string& v = it->second;
  bool in_list = std::find(f.values.begin(), f.values.end(), v) != f.values.end();
  switch(f.op){
    case EQ:     return !f.values.empty() && v==f.values[0];
    case NE:     return f.values.empty() || v!=f.values[0];
    case IN:     return in_list;
    case NOT_IN: return !in_list;
    default:     return true;
  }
}

std::optional<Category> resolve(const Step& s, const Feature& ft){
  const CategoryMapping& m = s.mapping;
  if(!m.attr.empty()){
    auto it = ft.attrs.find(m.attr);
    if(it!=ft.attrs.end()){
      auto hit = m.table.find(it->second);
      if(hit!=m.table.end()) return hit->second;
    }
  }
  return m.fallback;
}

std::string source_value(const Step& s, const Feature& ft){
  const std::string& key = !s.mapping.attr.empty() ? s.mapping.attr : s.filter.attr;
  if(key.empty()) return "";
  auto it = ft.attrs.find(key);
  return it==ft.attrs.end() ? "" : it->second;
}
