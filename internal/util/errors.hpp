#pragma once

#include <stdexcept>
#include <string>

namespace batch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

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

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Engine errors
// ---------------------------------------------------------------------

class DuplicateTaskError : public AlreadyExists {
 public:
  explicit DuplicateTaskError(const std::string& name) : AlreadyExists("task already registered: " + name) {
  }
};

class UnknownTaskError : public std::runtime_error {
 public:
  explicit UnknownTaskError(const std::string& name) : std::runtime_error("unknown task: " + name) {
  }
};

// Raised by task bodies; also used for failures that carry no other type.
class TaskExecutionError : public std::runtime_error {
 public:
  explicit TaskExecutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by TaskContext::ThrowIfCancelled().
class TaskCanceledError : public std::runtime_error {
 public:
  explicit TaskCanceledError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DependencyFailedError : public std::runtime_error {
 public:
  explicit DependencyFailedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QueueFullError : public ResourceExhausted {
 public:
  explicit QueueFullError(const std::string& msg) : ResourceExhausted(msg) {
  }
};

// Durable write failed. In-memory scheduling state is unaffected.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace batch::util
