#pragma once

#include <stdexcept>

namespace sceneseek {

// Malformed, empty or oversized embedding input. Retrying with the same input
// fails identically.
class EmbeddingFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ToolExecutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised by a tool when the entity it was asked about does not exist.
class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The decision/answer backend cannot be reached. Fatal for one loop run.
class GenerationBackendUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace sceneseek
