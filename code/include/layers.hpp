#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// Supplies the candidate features of a layer, already clipped to the AOI.
class LayerSource {
public:
  virtual ~LayerSource() = default;

  virtual bool has_layer(const std::string& layer) const = 0;

  // Throws LayerUnavailableError when the layer cannot be supplied.
  virtual const std::vector<Feature>& features(const std::string& layer) const = 0;
};

class MemoryLayers : public LayerSource {
public:
  bool has_layer(const std::string& layer) const override;
  const std::vector<Feature>& features(const std::string& layer) const override;

  // Creates the layer when absent (an empty layer is still "available").
  std::vector<Feature>& layer(const std::string& name);
  void add(const std::string& layer, Feature f);

  size_t layer_count() const { return layers_.size(); }
  size_t feature_count() const;

private:
  std::unordered_map<std::string, std::vector<Feature>> layers_;
};
