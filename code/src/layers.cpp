#include "layers.hpp"
#include "errors.hpp"

bool MemoryLayers::has_layer(const std::string& layer) const{
  return layers_.count(layer) > 0;
}

const std::vector<Feature>& MemoryLayers::features(const std::string& layer) const{
  auto it = layers_.find(layer);
  if(it==layers_.end()) throw LayerUnavailableError("layer not available: " + layer);
  return it->second;
}

std::vector<Feature>& MemoryLayers::layer(const std::string& name){
  return layers_[name];
}

void MemoryLayers::add(const std::string& layer, Feature f){
  auto& v = layers_[layer];
  if(f.layer.empty()) f.layer = layer;
  if(f.id.empty()) f.id = layer + "#" + std::to_string(v.size());
  v.push_back(std::move(f));
}

size_t MemoryLayers::feature_count() const{
  size_t n=0;
  for(const auto& kv : layers_) n += kv.second.size();
  return n;
}
