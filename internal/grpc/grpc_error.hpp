#pragma once

#include <exception>
#include <utility>

#include <grpcpp/grpcpp.h>

namespace livetv::grpc {

// Maps the util/errors.hpp exception types onto gRPC codes; anything else
// becomes INTERNAL.
::grpc::Status ToStatus(const std::exception& e);

// Runs one handler body. Requests whose caller already went away are not
// started; exceptions from the body are translated with ToStatus.
template <typename Fn>
::grpc::Status Serve(::grpc::ServerContext* context, Fn&& body) {
  if (context != nullptr && context->IsCancelled()) {
    return ::grpc::Status(::grpc::StatusCode::CANCELLED, "request cancelled by client");
  }
  try {
    std::forward<Fn>(body)();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace livetv::grpc
