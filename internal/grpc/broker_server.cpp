#include "broker_server.hpp"

#include "grpc_error.hpp"

namespace livetv::grpc {

using namespace livetv::broker::v1;

BrokerServer::BrokerServer(std::shared_ptr<livetv::service::BrokerService> svc) : service_(std::move(svc)) {
}

::grpc::Status BrokerServer::RequestChannel(::grpc::ServerContext* ctx, const RequestChannelRequest* req, AdmissionResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->RequestChannel(*req); });
}

::grpc::Status BrokerServer::Heartbeat(::grpc::ServerContext* ctx, const HeartbeatRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->Heartbeat(*req); });
}

::grpc::Status BrokerServer::ReleaseSession(::grpc::ServerContext* ctx, const ReleaseSessionRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->ReleaseSession(*req); });
}

::grpc::Status BrokerServer::PollQueue(::grpc::ServerContext* ctx, const PollQueueRequest* req, AdmissionResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->PollQueue(*req); });
}

::grpc::Status BrokerServer::CancelQueued(::grpc::ServerContext* ctx, const CancelQueuedRequest* req, ::google::protobuf::Empty*) {
  return Serve(ctx, [&] { service_->CancelQueued(*req); });
}

::grpc::Status BrokerServer::GetSession(::grpc::ServerContext* ctx, const GetSessionRequest* req, GetSessionResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->GetSession(*req); });
}

::grpc::Status BrokerServer::ListUserSessions(::grpc::ServerContext* ctx, const ListUserSessionsRequest* req, ListUserSessionsResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->ListUserSessions(*req); });
}

::grpc::Status BrokerServer::ValidateStreamAccess(::grpc::ServerContext* ctx, const ValidateStreamAccessRequest* req, ValidateStreamAccessResponse* resp) {
  return Serve(ctx, [&] { *resp = service_->ValidateStreamAccess(*req); });
}

} // namespace livetv::grpc
