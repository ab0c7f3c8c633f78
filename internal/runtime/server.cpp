#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace caretask::runtime {

namespace {
constexpr std::chrono::seconds kShutdownGrace{5};
}

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  int selected_port = 0;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  CARETASK_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                              observability::IntField("port", selected_port)});
}

void Server::Stop() {
  if (grpc_server_) {
    // in-flight calls get a grace period, then are cancelled
    grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
    grpc_server_.reset();
  }
}

} // namespace caretask::runtime
