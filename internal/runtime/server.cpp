#include "server.hpp"

#include <grpcpp/health_check_service_interface.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace checkout::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
  if (bind_address_.empty()) {
    bind_address_ = "0.0.0.0:50051";
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  // Standard grpc.health.v1.Health; reports SERVING for every registered service.
  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  CHECKOUT_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                              observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace checkout::runtime
