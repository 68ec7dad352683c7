#include "io.hpp"
#include "geom.hpp"
#include "parser.hpp"
#include "errors.hpp"
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

static std::ofstream open_out(const std::string& path){
  std::ofstream fout(path);
  if(!fout) throw std::runtime_error("Cannot open output file: "+path);
  fout << std::setprecision(std::numeric_limits<double>::max_digits10);
  return fout;
}

void write_result(const OutputMap& out, const std::string& out_path){
  std::ofstream fout = open_out(out_path);
  size_t lines = 0;
  for(Category c : {PUBLIC, PRIVATE, UNASSIGNED}){
    fout << category_name(c) << "\n";
    for(const auto& p : out[c]){
      fout << bg::wkt(p) << "\n";
      ++lines;
    }
  }
  if(!fout) throw std::runtime_error("Write failed: "+out_path);
  std::cerr << "[write_result] " << lines << " polygons written to " << out_path << "\n";
}

void write_diagnostics(const std::vector<StepDiag>& diags, const std::vector<Warning>& extra,
                       const std::string& out_path){
  std::ofstream fout(out_path);
  if(!fout) throw std::runtime_error("Cannot open output file: "+out_path);
  for(const auto& d : diags){
    print_step_summary(d, fout);
    fout << "  committed after step: public=" << d.committed_after[PUBLIC]
         << " private=" << d.committed_after[PRIVATE] << "\n";
    for(const auto& w : d.warnings) print_warning(w, fout);
  }
  if(!extra.empty()){
    fout << "[other]\n";
    for(const auto& w : extra) print_warning(w, fout);
  }
  print_run_summary(diags, fout);
  if(!fout) throw std::runtime_error("Write failed: "+out_path);
}

void write_records(const std::vector<FeatureRecord>& records, const std::string& out_path){
  std::ofstream fout = open_out(out_path);
  fout << "step\tlayer\tsource\tfeature\tcategory\tstatus\tclaimed_area\tsource_value\treason\tgeometry\n";
  for(const auto& r : records){
    fout << r.step_id << "\t" << r.layer << "\t" << r.source << "\t" << r.feature_id << "\t"
         << category_name(r.cat) << "\t" << feature_status_name(r.status) << "\t"
         << r.claimed_area << "\t" << r.source_value << "\t" << r.reason << "\t";
    if(r.geom.empty()) fout << "MULTIPOLYGON EMPTY\n";
    else fout << bg::wkt(r.geom) << "\n";
  }
  if(!fout) throw std::runtime_error("Write failed: "+out_path);
}

void save_checkpoint(const FrozenStore& store, size_t next_step, const std::string& path){
  std::string tmp = path + ".tmp";
  {
    std::ofstream fout = open_out(tmp);
    fout << "Checkpoint " << next_step << "\n";
    for(const auto& e : store.log()){
      fout << "Entry " << e.step_id << " " << category_name(e.cat) << "\n";
      fout << "Sources";
      for(const auto& id : e.sources) fout << "\t" << id;
      fout << "\n" << bg::wkt(e.delta) << "\n";
    }
    if(!fout) throw std::runtime_error("Write failed: "+tmp);
  }
  if(std::rename(tmp.c_str(), path.c_str())!=0)
    throw std::runtime_error("Cannot move checkpoint into place: "+path);
}

size_t load_checkpoint(const std::string& path, FrozenStore& into){
  std::ifstream fin(path);
  if(!fin) throw std::runtime_error("Cannot open checkpoint: "+path);
  std::string line, word;
  if(!std::getline(fin, line)) throw std::runtime_error("Empty checkpoint: "+path);
  std::istringstream head(line);
  long long next = -1;
  if(!(head >> word >> next) || word!="Checkpoint" || next < 0)
    throw std::runtime_error("Bad checkpoint header in "+path);

  int line_num = 1;
  while(std::getline(fin, line)){
    line_num++;
    if(line.empty()) continue;
    std::istringstream ss(line);
    LogEntry e;
    std::string cat;
    if(!(ss >> word >> e.step_id >> cat) || word!="Entry" || !parse_category(cat, e.cat))
      throw std::runtime_error(path + ":" + std::to_string(line_num) + ": expected 'Entry <step> <category>'");

    std::string src, wkt;
    if(!std::getline(fin, src) || !std::getline(fin, wkt))
      throw std::runtime_error(path + ": truncated entry for step " + std::to_string(e.step_id));
    line_num += 2;
    std::istringstream ids(src);
    std::string id;
    std::getline(ids, id, '\t');                 // "Sources"
    while(std::getline(ids, id, '\t')) e.sources.push_back(id);
    e.delta = read_polygonal_wkt(wkt);
    e.area = area_of(e.delta);
    into.replay(e);
  }
  return (size_t)next;
}
