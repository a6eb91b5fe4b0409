#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "livetv/broker/v1.hpp"

namespace livetv::grpc {

class AdminServer final : public livetv::broker::v1::BrokerAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<livetv::service::AdminService> svc);

  ::grpc::Status GetStatus(::grpc::ServerContext*, const livetv::broker::v1::GetStatusRequest*, livetv::broker::v1::GetStatusResponse*) override;
  ::grpc::Status MarkTunerFailed(::grpc::ServerContext*, const livetv::broker::v1::TunerRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status MarkTunerRecovered(::grpc::ServerContext*, const livetv::broker::v1::TunerRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status SetTunerMaintenance(::grpc::ServerContext*, const livetv::broker::v1::SetTunerMaintenanceRequest*, ::google::protobuf::Empty*) override;
  ::grpc::Status ReleaseUserSessions(::grpc::ServerContext*, const livetv::broker::v1::ReleaseUserSessionsRequest*, livetv::broker::v1::ReleaseCountResponse*) override;
  ::grpc::Status ReleaseCredentialSessions(::grpc::ServerContext*, const livetv::broker::v1::ReleaseCredentialSessionsRequest*, livetv::broker::v1::ReleaseCountResponse*) override;
  ::grpc::Status GetCredentialCapacity(::grpc::ServerContext*, const livetv::broker::v1::GetCredentialCapacityRequest*, livetv::broker::v1::CredentialCapacity*) override;
  ::grpc::Status SweepNow(::grpc::ServerContext*, const livetv::broker::v1::SweepNowRequest*, livetv::broker::v1::SweepNowResponse*) override;
  ::grpc::Status ListViewingHistory(::grpc::ServerContext*, const livetv::broker::v1::ListViewingHistoryRequest*, livetv::broker::v1::ListViewingHistoryResponse*) override;

private:
  std::shared_ptr<livetv::service::AdminService> service_;
};

} // namespace livetv::grpc
