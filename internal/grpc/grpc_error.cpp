#include "grpc_error.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace batch::grpc {
namespace {

template <typename T>
bool Is(const std::exception& e) {
  return dynamic_cast<const T*>(&e) != nullptr;
}

// Order matters: subclasses (DuplicateTaskError, QueueFullError) resolve
// through their base.
::grpc::StatusCode CodeFor(const std::exception& e) {
  if (Is<util::NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (Is<util::AlreadyExists>(e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (Is<util::InvalidState>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (Is<util::ResourceExhausted>(e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  if (Is<util::UnknownTaskError>(e) || Is<std::invalid_argument>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (Is<util::PersistenceError>(e)) return ::grpc::StatusCode::UNAVAILABLE;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  return ::grpc::Status(CodeFor(e), e.what());
}

} // namespace batch::grpc
