#pragma once

#include <stdexcept>
#include <string>

namespace fraudit::util {

/*
  Central error types.

  Nothing derived from these crosses the rule orchestrator boundary;
  matching batches and rules catch them and report them in the run summary.
*/

// Bad or missing normalized key, malformed edge or request.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Referenced entity or alert no longer exists.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unexpected failure inside one unit of work (a matching batch or a rule).
class ComputeError : public std::runtime_error {
 public:
  explicit ComputeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fraudit::util
