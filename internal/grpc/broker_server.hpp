#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/broker_service.hpp"
#include "livetv/broker/v1.hpp"

namespace livetv::grpc {

// Thin transport adapter; all semantics live in the service.
class BrokerServer final : public livetv::broker::v1::TunerBrokerService::Service {
public:
  explicit BrokerServer(std::shared_ptr<livetv::service::BrokerService> svc);

  ::grpc::Status RequestChannel(::grpc::ServerContext*, const livetv::broker::v1::RequestChannelRequest*, livetv::broker::v1::AdmissionResponse*) override;
  ::grpc::Status Heartbeat(::grpc::ServerContext*, const livetv::broker::v1::HeartbeatRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status ReleaseSession(::grpc::ServerContext*, const livetv::broker::v1::ReleaseSessionRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status PollQueue(::grpc::ServerContext*, const livetv::broker::v1::PollQueueRequest*, livetv::broker::v1::AdmissionResponse*) override;
  ::grpc::Status CancelQueued(::grpc::ServerContext*, const livetv::broker::v1::CancelQueuedRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status GetSession(::grpc::ServerContext*, const livetv::broker::v1::GetSessionRequest*, livetv::broker::v1::GetSessionResponse*) override;
  ::grpc::Status ListUserSessions(::grpc::ServerContext*, const livetv::broker::v1::ListUserSessionsRequest*, livetv::broker::v1::ListUserSessionsResponse*) override;
  ::grpc::Status ValidateStreamAccess(::grpc::ServerContext*, const livetv::broker::v1::ValidateStreamAccessRequest*, livetv::broker::v1::ValidateStreamAccessResponse*) override;

private:
  std::shared_ptr<livetv::service::BrokerService> service_;
};

} // namespace livetv::grpc
