#include "parser.hpp"
#include "geom.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <algorithm>
#include <stdexcept>

static std::string trim(const std::string& s){
  size_t i=0,j=s.size();
  while(i<j && std::isspace((unsigned char)s[i])) ++i;
  while(j>i && std::isspace((unsigned char)s[j-1])) --j;
  return s.substr(i,j-i);
}

static std::string upper(std::string s){
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::toupper(c); });
  return s;
}

// Splits on whitespace; "double quoted" tokens keep spaces and commas.
static std::vector<std::string> tokenize(const std::string& line){
  std::vector<std::string> out;
  size_t i=0, n=line.size();
  while(i<n){
    while(i<n && std::isspace((unsigned char)line[i])) ++i;
    if(i>=n) break;
    std::string tok;
    if(line[i]=='"'){
      size_t end = line.find('"', i+1);
      if(end==std::string::npos) throw std::runtime_error("unterminated quote");
      tok = line.substr(i+1, end-i-1);
      i = end+1;
    }else{
      size_t start=i;
      while(i<n && !std::isspace((unsigned char)line[i])) ++i;
      tok = line.substr(start, i-start);
    }
    out.push_back(tok);
  }
  return out;
}

static std::string strip_comment(const std::string& line){
  bool quoted=false;
  for(size_t i=0;i<line.size();++i){
    if(line[i]=='"') quoted=!quoted;
    else if(line[i]=='#' && !quoted) return line.substr(0,i);
  }
  return line;
}

static Category category_or_throw(const std::string& tok){
  Category c;
  if(!parse_category(tok, c)) throw std::runtime_error("unknown category '" + tok + "'");
  return c;
}

static FilterOp filter_op_or_throw(const std::string& tok){
  std::string t = upper(tok);
  if(t=="EQ") return EQ;
  if(t=="NE") return NE;
  if(t=="IN") return IN;
  if(t=="NOT_IN") return NOT_IN;
  throw std::runtime_error("unknown filter operator '" + tok + "'");
}

RuleTable parse_rule_stream(std::istream& in, const std::string& name){
  RuleTable R;
  Step* cur=nullptr;
  std::string line;
  int line_num=0;
  while(std::getline(in,line)){
    line_num++;
    line = trim(strip_comment(line));
    if(line.empty()) continue;
    try {
      auto tok = tokenize(line);
      std::string key = upper(tok[0]);
      if(key=="STEP"){
        if(tok.size()!=2) throw std::runtime_error("expected 'Step <id>'");
        R.steps.emplace_back();
        cur = &R.steps.back();
        cur->id = std::stoi(tok[1]);
        continue;
      }
      if(!cur) throw std::runtime_error("'" + tok[0] + "' before the first Step");
      if(key=="LAYER"){
        if(tok.size()!=2) throw std::runtime_error("expected 'Layer <name>'");
        cur->layer = tok[1];
      }else if(key=="SOURCE"){
        cur->source = trim(line.substr(tok[0].size()));
      }else if(key=="REASON"){
        cur->reason = trim(line.substr(tok[0].size()));
      }else if(key=="FILTER"){
        if(tok.size()==2 && upper(tok[1])=="ANY"){ cur->filter = AttrFilter(); continue; }
        if(tok.size()<4) throw std::runtime_error("expected 'Filter <attr> <op> <values...>'");
        cur->filter.attr = tok[1];
        cur->filter.op = filter_op_or_throw(tok[2]);
        cur->filter.values.assign(tok.begin()+3, tok.end());
      }else if(key=="MAP"){
        if(tok.size()!=2) throw std::runtime_error("expected 'Map <attr>'");
        cur->mapping.attr = tok[1];
      }else if(key=="VALUE"){
        if(tok.size()!=3) throw std::runtime_error("expected 'Value \"<value>\" <category>'");
        if(cur->mapping.attr.empty()) throw std::runtime_error("'Value' before 'Map'");
        cur->mapping.table[tok[1]] = category_or_throw(tok[2]);
      }else if(key=="DEFAULT"){
        if(tok.size()!=2) throw std::runtime_error("expected 'Default <category>'");
        cur->mapping.fallback = category_or_throw(tok[1]);
      }else if(key=="PRECEDENCE"){
        cur->precedence.clear();
        for(size_t i=1;i<tok.size();++i){
          Category c = category_or_throw(tok[i]);
          if(std::find(cur->precedence.begin(), cur->precedence.end(), c)!=cur->precedence.end())
            throw std::runtime_error("category listed twice in Precedence");
          cur->precedence.push_back(c);
        }
      }else if(key=="OPTIONAL"){
        cur->optional = true;
      }else{
        throw std::runtime_error("unknown keyword '" + tok[0] + "'");
      }
    } catch(const std::logic_error& e){      // std::stoi
      throw std::runtime_error(name + ":" + std::to_string(line_num) + ": bad number (" + e.what() + ")");
    } catch(const std::runtime_error& e){
      throw std::runtime_error(name + ":" + std::to_string(line_num) + ": " + e.what());
    }
  }
  validate_rules(R);
  return R;
}

RuleTable parse_rule_file(const std::string& rule_path){
  std::ifstream fin(rule_path);
  if(!fin) throw std::runtime_error("Cannot open rule file: "+rule_path);
  return parse_rule_stream(fin, rule_path);
}

MPoly read_polygonal_wkt(const std::string& wkt){
  std::string t = trim(wkt);
  std::string u = upper(t);
  size_t kw_end = 0;
  while(kw_end<u.size() && std::isalpha((unsigned char)u[kw_end])) ++kw_end;
  std::string kind = u.substr(0, kw_end);
  bool empty = trim(u.substr(kw_end))=="EMPTY";
  MPoly m;
  try {
    if(kind=="POLYGON"){
      if(empty) return m;
      Poly p;
      bg::read_wkt(t, p);
      m.push_back(p);
    }else if(kind=="MULTIPOLYGON"){
      if(empty) return m;
      bg::read_wkt(t, m);
    }else{
      throw GeometryError("non-polygonal geometry '" + (kind.empty() ? t : kind) + "'");
    }
  } catch(const bg::read_wkt_exception& e){
    throw GeometryError(std::string("malformed WKT: ") + e.what());
  }
  return m;
}

void parse_layer_stream(std::istream& in, const std::string& name, MemoryLayers& into,
                        const Config& cfg, std::vector<Warning>& rejected){
  std::string line, cur_layer;
  int line_num=0;
  while(std::getline(in,line)){
    line_num++;
    line = trim(line);
    if(line.empty() || line[0]=='#') continue;

    if(upper(line.substr(0,6))=="LAYER "){
      cur_layer = trim(line.substr(6));
      into.layer(cur_layer);     // an empty layer is still available
      continue;
    }
    if(cur_layer.empty())
      throw std::runtime_error(name + ":" + std::to_string(line_num) + ": feature before the first 'Layer' line");

    // "<WKT> | key=value | key=value"
    std::vector<std::string> fields;
    size_t pos=0;
    while(true){
      size_t bar = line.find('|', pos);
      fields.push_back(trim(line.substr(pos, bar==std::string::npos ? std::string::npos : bar-pos)));
      if(bar==std::string::npos) break;
      pos = bar+1;
    }
    Feature f;
    f.layer = cur_layer;
    for(size_t i=1;i<fields.size();++i){
      size_t eq = fields[i].find('=');
      if(eq==std::string::npos) continue;
      f.attrs[trim(fields[i].substr(0,eq))] = trim(fields[i].substr(eq+1));
    }
    auto idit = f.attrs.find(cfg.id_attribute);
    f.id = idit!=f.attrs.end() ? idit->second
                               : cur_layer + "#" + std::to_string(into.layer(cur_layer).size());
    try {
      f.geom = read_polygonal_wkt(fields[0]);
    } catch(const GeometryError& e){
      Warning w;
      w.kind = W_GEOMETRY; w.layer = cur_layer; w.feature_id = f.id;
      w.message = name + ":" + std::to_string(line_num) + ": " + e.what();
      rejected.push_back(w);
      continue;
    }
    into.add(cur_layer, std::move(f));
  }
}

void parse_layer_file(const std::string& layer_path, MemoryLayers& into, const Config& cfg,
                      std::vector<Warning>& rejected){
  std::ifstream fin(layer_path);
  if(!fin) throw std::runtime_error("Cannot open layer file: "+layer_path);
  parse_layer_stream(fin, layer_path, into, cfg, rejected);
}

MPoly parse_aoi_stream(std::istream& in, const std::string& name){
  std::vector<MPoly> parts;
  std::string line;
  int line_num=0;
  while(std::getline(in,line)){
    line_num++;
    line = trim(line);
    if(line.empty() || line[0]=='#') continue;
    MPoly m;
    try {
      m = read_polygonal_wkt(line);
    } catch(const GeometryError& e){
      throw GeometryError(name + ":" + std::to_string(line_num) + ": " + e.what());
    }
    std::string why;
    if(!repair(m, &why)) throw GeometryError(name + ":" + std::to_string(line_num) + ": " + why);
    parts.push_back(std::move(m));
  }
  return union_all(std::move(parts));
}

MPoly parse_aoi_file(const std::string& aoi_path){
  std::ifstream fin(aoi_path);
  if(!fin) throw std::runtime_error("Cannot open AOI file: "+aoi_path);
  return parse_aoi_stream(fin, aoi_path);
}
