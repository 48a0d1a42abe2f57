#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Failure of one analysis stage. `stage()` names the step that gave up so the
// request layer can pick a status code and message.
class AnalysisError : public std::runtime_error {
public:
  AnalysisError(std::string stage, const std::string &what)
      : std::runtime_error(what), stage_(std::move(stage)) {}
  const std::string &stage() const noexcept { return stage_; }

private:
  std::string stage_;
};

// Track rejected before any work started (empty, out of range coordinates).
class InputError : public AnalysisError {
public:
  explicit InputError(const std::string &what) : AnalysisError("input", what) {}
};

// Geodata could not be fetched after the bounded retry and the active policy
// does not allow a degraded result.
class GeodataUnavailable : public AnalysisError {
public:
  explicit GeodataUnavailable(const std::string &what)
      : AnalysisError("geodata", what) {}
};

// Raised by GeodataSource implementations for a single failed attempt.
class GeodataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
