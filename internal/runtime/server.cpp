#include "server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace batch::runtime {

Server::Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw std::logic_error("server already started");
  }

  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, grpc::InsecureServerCredentials(), &selected_port_);
  if (options_.max_message_bytes > 0) {
    builder.SetMaxReceiveMessageSize(options_.max_message_bytes);
    builder.SetMaxSendMessageSize(options_.max_message_bytes);
  }
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(true);
  }

  BATCH_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", options_.bind_address),
                                           observability::IntField("port", selected_port_),
                                           observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(false);
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();

  BATCH_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", options_.bind_address)});
}

} // namespace batch::runtime
