#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace rackwise::runtime {

/*
  Owns the gRPC server and the services registered on it.

  Stop() gives in-flight topology calls shutdown_grace to finish before they
  are cancelled; the destructor stops a running server.
*/
class Server {
 public:
  Server(std::string bind_address, std::chrono::milliseconds shutdown_grace, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound, useful when bind_address asks for port 0.
  int Port() const {
    return port_;
  }

 private:
  std::string                                   bind_address_;
  std::chrono::milliseconds                     shutdown_grace_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           port_ = 0;
};

} // namespace rackwise::runtime
