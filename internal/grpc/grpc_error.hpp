#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace batch::grpc {

/*
  Engine exception -> gRPC status.

    NotFound                           NOT_FOUND
    AlreadyExists, DuplicateTaskError  ALREADY_EXISTS
    InvalidState                       FAILED_PRECONDITION
    QueueFullError                     RESOURCE_EXHAUSTED
    UnknownTaskError, invalid_argument INVALID_ARGUMENT
    PersistenceError                   UNAVAILABLE
    anything else                      INTERNAL

  The message is passed through unchanged.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace batch::grpc
