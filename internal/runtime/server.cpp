#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace rackwise::runtime {

Server::Server(std::string bind_address, std::chrono::milliseconds shutdown_grace, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), shutdown_grace_(shutdown_grace), services_(std::move(services)) {
  if (bind_address_.empty()) {
    throw std::invalid_argument("Server: bind address is required");
  }
  if (services_.empty()) {
    throw std::invalid_argument("Server: no services to register");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  RACKWISE_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_), observability::IntField("port", port_),
                                              observability::SizeField("services", services_.size())});
}

void Server::Stop() {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
  grpc_server_.reset();
  RACKWISE_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace rackwise::runtime
