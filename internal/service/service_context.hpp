#pragma once

#include <memory>

namespace batch::engine {
class JobEngine;
}

namespace batch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<batch::engine::JobEngine> engine;
};

} // namespace batch::service
