#pragma once
#include <stdexcept>
#include <string>

// Per-feature, non-fatal unless raised at the loader boundary.
struct GeometryError : std::runtime_error {
  explicit GeometryError(const std::string& m) : std::runtime_error(m) {}
};

// NoMatch promoted to a fatal error (Config::abort_on_no_match).
struct UnknownCategoryError : std::runtime_error {
  explicit UnknownCategoryError(const std::string& m) : std::runtime_error(m) {}
};

struct EmptyAreaOfInterestError : std::runtime_error {
  explicit EmptyAreaOfInterestError(const std::string& m) : std::runtime_error(m) {}
};

struct StepOrderError : std::runtime_error {
  explicit StepOrderError(const std::string& m) : std::runtime_error(m) {}
};

struct LayerUnavailableError : std::runtime_error {
  explicit LayerUnavailableError(const std::string& m) : std::runtime_error(m) {}
};

// Misuse of the engine state machine (commit after seal, finalize too early, ...).
struct EngineStateError : std::logic_error {
  explicit EngineStateError(const std::string& m) : std::logic_error(m) {}
};
