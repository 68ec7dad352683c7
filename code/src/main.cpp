#include "parser.hpp"
#include "engine.hpp"
#include "io.hpp"
#include "errors.hpp"
#include <iostream>

static void usage(){
  std::cerr << "Usage: partition -aoi <aoi.wkt> -rule <rules.txt> -layers <layers.txt> [-layers ...]\n"
               "                 -output <result.txt> [-diag <diag.txt>] [-records <records.tsv>]\n"
               "                 [-thread n] [-sliver ratio] [-strict] [-per-feature] [-checkpoint <file> [-resume]] [-quiet]\n";
}

int main(int argc, char** argv){
  std::string aoi_path, rule_path, out_path, diag_path, records_path;
  std::vector<std::string> layer_paths;
  bool resume=false;
  Config cfg;

  try {
    for(int i=1;i<argc;i++){
      std::string a=argv[i];
      auto need=[&](const char* k){ return a==k && i+1<argc; };
      if(need("-aoi")) aoi_path=argv[++i];
      else if(need("-rule")) rule_path=argv[++i];
      else if(need("-layers")) layer_paths.push_back(argv[++i]);
      else if(need("-output")) out_path=argv[++i];
      else if(need("-diag")) diag_path=argv[++i];
      else if(need("-records")) records_path=argv[++i];
      else if(need("-thread")) cfg.threads=std::stoi(argv[++i]);
      else if(need("-sliver")) cfg.sliver_ratio=std::stod(argv[++i]);
      else if(need("-checkpoint")) cfg.checkpoint_path=argv[++i];
      else if(a=="-resume") resume=true;
      else if(a=="-strict") cfg.abort_on_no_match=true;
      else if(a=="-per-feature") cfg.per_feature_commits=true;
      else if(a=="-quiet") cfg.verbose=false;
      else { std::cerr << "Unknown argument: " << a << "\n"; usage(); return 1; }
    }
  } catch(const std::logic_error& e){
    std::cerr << "Bad numeric argument (" << e.what() << ")\n";
    return 1;
  }
  if(aoi_path.empty()||rule_path.empty()||layer_paths.empty()||out_path.empty()||
     (resume && cfg.checkpoint_path.empty())){
    usage();
    return 1;
  }

  RuleTable R;
  MPoly aoi;
  MemoryLayers layers;
  std::vector<Warning> rejected;
  try {
    R = parse_rule_file(rule_path);
    aoi = parse_aoi_file(aoi_path);
    for(const auto& p : layer_paths) parse_layer_file(p, layers, cfg, rejected);
  } catch(const std::exception& e){
    std::cerr << "[load] " << e.what() << "\n";
    return 1;
  }
  if(cfg.verbose){
    std::cerr << "[load] " << R.steps.size() << " steps, " << layers.layer_count() << " layers, "
              << layers.feature_count() << " features, " << rejected.size() << " rejected\n";
    for(const auto& w : rejected) print_warning(w);
  }

  int status = 0;
  try {
    Engine eng(aoi, R, layers, cfg);
    if(resume){
      FrozenStore store(eng.store().sliver_tol());
      size_t next = load_checkpoint(cfg.checkpoint_path, store);
      eng.resume(std::move(store), next);
    }
    if(!cfg.checkpoint_path.empty()){
      eng.after_step = [&](const Engine& e){
        save_checkpoint(e.store(), e.next_step(), cfg.checkpoint_path);
      };
    }

    try {
      OutputMap out = eng.run();
      write_result(out, out_path);
      rejected.insert(rejected.end(), eng.final_warnings().begin(), eng.final_warnings().end());
    } catch(const std::exception& e){
      std::cerr << "[abort] " << e.what() << " (state " << engine_state_name(eng.state()) << ")\n";
      status = 2;
    }
    // partial diagnostics are surfaced on abort too
    if(cfg.verbose) print_run_summary(eng.diagnostics());
    if(!diag_path.empty()) write_diagnostics(eng.diagnostics(), rejected, diag_path);
    if(!records_path.empty()) write_records(eng.records(), records_path);
  } catch(const std::exception& e){
    std::cerr << "[engine] " << e.what() << "\n";
    return status ? status : 1;
  }
  return status;
}
