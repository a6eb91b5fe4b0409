#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace livetv::grpc {

using namespace livetv::broker::v1;

AdminServer::AdminServer(std::shared_ptr<livetv::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetStatus(::grpc::ServerContext* ctx, const GetStatusRequest* req, GetStatusResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->GetStatus(*req); });
}

::grpc::Status AdminServer::MarkTunerFailed(::grpc::ServerContext* ctx, const TunerRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->MarkTunerFailed(*req); });
}

::grpc::Status AdminServer::MarkTunerRecovered(::grpc::ServerContext* ctx, const TunerRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->MarkTunerRecovered(*req); });
}

::grpc::Status AdminServer::SetTunerMaintenance(::grpc::ServerContext* ctx, const SetTunerMaintenanceRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->SetTunerMaintenance(*req); });
}

::grpc::Status AdminServer::ReleaseUserSessions(::grpc::ServerContext* ctx, const ReleaseUserSessionsRequest* req, ReleaseCountResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->ReleaseUserSessions(*req); });
}

::grpc::Status AdminServer::ReleaseCredentialSessions(::grpc::ServerContext* ctx, const ReleaseCredentialSessionsRequest* req, ReleaseCountResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->ReleaseCredentialSessions(*req); });
}

::grpc::Status AdminServer::GetCredentialCapacity(::grpc::ServerContext* ctx, const GetCredentialCapacityRequest* req, CredentialCapacity* resp) {
  return Serve(ctx, [&] { *resp = service_->GetCredentialCapacity(*req); });
}

::grpc::Status AdminServer::SweepNow(::grpc::ServerContext* ctx, const SweepNowRequest* req, SweepNowResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->SweepNow(*req); });
}

::grpc::Status AdminServer::ListViewingHistory(::grpc::ServerContext* ctx, const ListViewingHistoryRequest* req, ListViewingHistoryResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->ListViewingHistory(*req); });
}

} // namespace livetv::grpc
