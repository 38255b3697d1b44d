#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace batch::runtime {

struct ServerOptions {
  std::string               bind_address;
  int                       max_message_bytes = 0;
  std::chrono::milliseconds shutdown_grace{5000};
};

/*
  Hosts the job services plus the standard grpc.health.v1 service. Health
  reports SERVING between Start() and Stop().
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();

  // Flips health to NOT_SERVING, then waits up to shutdown_grace for
  // in-flight calls before cancelling them. Idempotent.
  void Stop();

  // Port chosen by the OS when bind_address ends in ":0".
  int SelectedPort() const {
    return selected_port_;
  }

 private:
  ServerOptions                               options_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server>               grpc_server_;
  int                                         selected_port_ = 0;
};

} // namespace batch::runtime
