#include "client/cpp/broker_client.h"

#include <chrono>
#include <string>
#include <string_view>
#include <thread>

#include <grpcpp/client_context.h>

namespace livetv::broker::client {

namespace v1 = livetv::broker::v1;

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  const std::string prefix = std::string(action) + " failed: ";
  switch (status.error_code()) {
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(prefix, status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(prefix, status.error_message());
    case grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::CapacityError(prefix, status.error_message());
    case grpc::StatusCode::CANCELLED:
      return arrow::Status::Cancelled(prefix, status.error_message());
    default:
      return arrow::Status::IOError(prefix, status.error_message());
  }
}

} // namespace

BrokerClient::BrokerClient(std::shared_ptr<grpc::Channel> channel)
    : broker_stub_(v1::TunerBrokerService::NewStub(channel)), admin_stub_(v1::BrokerAdminService::NewStub(std::move(channel))) {}

arrow::Result<v1::AdmissionResponse> BrokerClient::RequestChannel(const v1::RequestChannelRequest& request) const {
  v1::AdmissionResponse response;
  grpc::ClientContext   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(broker_stub_->RequestChannel(&ctx, request, &response), "RequestChannel"));
  return response;
}

arrow::Status BrokerClient::Heartbeat(const std::string& session_id) const {
  v1::HeartbeatRequest req;
  req.set_session_id(session_id);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(broker_stub_->Heartbeat(&ctx, req, &resp), "Heartbeat");
}

arrow::Status BrokerClient::ReleaseSession(const std::string& session_id, const std::string& user_id) const {
  v1::ReleaseSessionRequest req;
  req.set_session_id(session_id);
  req.set_user_id(user_id);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(broker_stub_->ReleaseSession(&ctx, req, &resp), "ReleaseSession");
}

arrow::Result<v1::AdmissionResponse> BrokerClient::PollQueue(const std::string& ticket_id) const {
  v1::PollQueueRequest req;
  req.set_ticket_id(ticket_id);
  v1::AdmissionResponse resp;
  grpc::ClientContext   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(broker_stub_->PollQueue(&ctx, req, &resp), "PollQueue"));
  return resp;
}

arrow::Status BrokerClient::CancelQueued(const std::string& ticket_id) const {
  v1::CancelQueuedRequest req;
  req.set_ticket_id(ticket_id);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(broker_stub_->CancelQueued(&ctx, req, &resp), "CancelQueued");
}

arrow::Result<v1::StreamSession> BrokerClient::WaitForSession(const std::string& ticket_id, std::chrono::milliseconds poll_interval,
                                                              std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    ARROW_ASSIGN_OR_RAISE(auto admission, PollQueue(ticket_id));
    if (admission.has_session()) {
      return admission.session();
    }
    if (std::chrono::steady_clock::now() + poll_interval > deadline) {
      ARROW_RETURN_NOT_OK(CancelQueued(ticket_id));
      return arrow::Status::Cancelled("ticket ", ticket_id, " still queued at position ", admission.queued().position());
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

arrow::Result<v1::StreamSession> BrokerClient::GetSession(const std::string& session_id) const {
  v1::GetSessionRequest req;
  req.set_session_id(session_id);
  v1::GetSessionResponse resp;
  grpc::ClientContext    ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(broker_stub_->GetSession(&ctx, req, &resp), "GetSession"));
  return resp.session();
}

arrow::Result<v1::ListUserSessionsResponse> BrokerClient::ListUserSessions(const std::string& user_id) const {
  v1::ListUserSessionsRequest req;
  req.set_user_id(user_id);
  v1::ListUserSessionsResponse resp;
  grpc::ClientContext          ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(broker_stub_->ListUserSessions(&ctx, req, &resp), "ListUserSessions"));
  return resp;
}

arrow::Result<v1::ValidateStreamAccessResponse> BrokerClient::ValidateStreamAccess(const std::string& session_id,
                                                                                   const std::string& channel_key) const {
  v1::ValidateStreamAccessRequest req;
  req.set_session_id(session_id);
  req.set_channel_key(channel_key);
  v1::ValidateStreamAccessResponse resp;
  grpc::ClientContext              ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(broker_stub_->ValidateStreamAccess(&ctx, req, &resp), "ValidateStreamAccess"));
  return resp;
}

arrow::Result<v1::GetStatusResponse> BrokerClient::GetStatus() const {
  v1::GetStatusRequest  req;
  v1::GetStatusResponse resp;
  grpc::ClientContext   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetStatus(&ctx, req, &resp), "GetStatus"));
  return resp;
}

arrow::Status BrokerClient::MarkTunerFailed(uint32_t tuner_id) const {
  v1::TunerRequest req;
  req.set_tuner_id(tuner_id);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(admin_stub_->MarkTunerFailed(&ctx, req, &resp), "MarkTunerFailed");
}

arrow::Status BrokerClient::MarkTunerRecovered(uint32_t tuner_id) const {
  v1::TunerRequest req;
  req.set_tuner_id(tuner_id);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(admin_stub_->MarkTunerRecovered(&ctx, req, &resp), "MarkTunerRecovered");
}

arrow::Status BrokerClient::SetTunerMaintenance(uint32_t tuner_id, bool enabled) const {
  v1::SetTunerMaintenanceRequest req;
  req.set_tuner_id(tuner_id);
  req.set_enabled(enabled);
  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  return GrpcToArrow(admin_stub_->SetTunerMaintenance(&ctx, req, &resp), "SetTunerMaintenance");
}

arrow::Result<uint32_t> BrokerClient::ReleaseUserSessions(const std::string& user_id) const {
  v1::ReleaseUserSessionsRequest req;
  req.set_user_id(user_id);
  v1::ReleaseCountResponse resp;
  grpc::ClientContext      ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ReleaseUserSessions(&ctx, req, &resp), "ReleaseUserSessions"));
  return resp.released();
}

arrow::Result<uint32_t> BrokerClient::ReleaseCredentialSessions(uint64_t credential_id) const {
  v1::ReleaseCredentialSessionsRequest req;
  req.set_credential_id(credential_id);
  v1::ReleaseCountResponse resp;
  grpc::ClientContext      ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ReleaseCredentialSessions(&ctx, req, &resp), "ReleaseCredentialSessions"));
  return resp.released();
}

arrow::Result<v1::CredentialCapacity> BrokerClient::GetCredentialCapacity(uint64_t credential_id) const {
  v1::GetCredentialCapacityRequest req;
  req.set_credential_id(credential_id);
  v1::CredentialCapacity resp;
  grpc::ClientContext    ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetCredentialCapacity(&ctx, req, &resp), "GetCredentialCapacity"));
  return resp;
}

arrow::Result<v1::SweepNowResponse> BrokerClient::SweepNow() const {
  v1::SweepNowRequest  req;
  v1::SweepNowResponse resp;
  grpc::ClientContext  ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->SweepNow(&ctx, req, &resp), "SweepNow"));
  return resp;
}

arrow::Result<v1::ListViewingHistoryResponse> BrokerClient::ListViewingHistory(const std::string& user_id, uint32_t limit) const {
  v1::ListViewingHistoryRequest req;
  req.set_user_id(user_id);
  req.set_limit(limit);
  v1::ListViewingHistoryResponse resp;
  grpc::ClientContext            ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListViewingHistory(&ctx, req, &resp), "ListViewingHistory"));
  return resp;
}

} // namespace livetv::broker::client
