#pragma once

#include <stdexcept>
#include <string>

namespace pagequeue::util {

/*
  Central error types.

  The service facade translates these into outcome codes for the
  transport layer.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The download window of a finished job has passed.
class WindowExpired : public std::runtime_error {
 public:
  explicit WindowExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unreadable or structurally invalid document.
class CorruptDocument : public std::runtime_error {
 public:
  explicit CorruptDocument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Split / transform / merge failure. Terminal for the job.
class PipelineError : public std::runtime_error {
 public:
  explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pagequeue::util
