#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace livetv::runtime {

/*
  Owns the gRPC transport adapters and the listening server. Stop is
  idempotent and also runs from the destructor.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

  // Port actually bound; useful with "host:0".
  int SelectedPort() const {
    return selected_port_;
  }

 private:
  std::string                                 bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                         selected_port_ = 0;
};

} // namespace livetv::runtime
