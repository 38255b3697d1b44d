#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/engine/job_engine.hpp"

namespace batch::factory {

/*
  Application

  Owns everything the process keeps alive: the engine and the gRPC
  services bound to it. The engine is not started yet.
*/
struct Application {
  std::shared_ptr<engine::JobEngine>            engine;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const batch::runtime::config::RuntimeConfig& config);

engine::EngineOptions BuildEngineOptions(const batch::runtime::config::RuntimeConfig& config);

Application Build(const batch::runtime::config::RuntimeConfig& config);

} // namespace batch::factory
