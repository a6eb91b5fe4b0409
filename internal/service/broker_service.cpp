#include "broker_service.hpp"

#include "internal/core/tuner_broker.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace livetv::service {

using namespace livetv::broker::v1;

namespace {

void RequireId(const std::string& value, std::string_view what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " is required");
  }
}

} // namespace

BrokerService::BrokerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AdmissionResponse BrokerService::RequestChannel(const RequestChannelRequest& req) {
  return ObserveRpc("TunerBrokerService.RequestChannel", "channel", req.channel_key(), [&] {
    core::ChannelRequest request;
    request.user_id     = req.user_id();
    request.channel_key = req.channel_key();
    request.kind        = FromProto(req.resource_kind());
    request.user_class  = FromProto(req.user_class());
    if (req.has_priority()) {
      request.priority = req.priority();
    }
    request.provider_id = req.provider_id();
    request.device_type = req.device_type();
    request.ip_address  = req.ip_address();

    return ToProto(ctx_.broker->RequestChannel(request));
  });
}

void BrokerService::Heartbeat(const HeartbeatRequest& req) {
  ObserveRpc("TunerBrokerService.Heartbeat", "session_id", req.session_id(), [&] {
    RequireId(req.session_id(), "session_id");
    ctx_.broker->Heartbeat(req.session_id());
  });
}

void BrokerService::ReleaseSession(const ReleaseSessionRequest& req) {
  ObserveRpc("TunerBrokerService.ReleaseSession", "session_id", req.session_id(), [&] {
    // beacons may carry nothing useful; that is still a successful release
    if (req.session_id().empty()) return;
    ctx_.broker->ReleaseSession(req.session_id(), req.user_id());
  });
}

AdmissionResponse BrokerService::PollQueue(const PollQueueRequest& req) {
  return ObserveRpc("TunerBrokerService.PollQueue", "ticket_id", req.ticket_id(), [&] {
    RequireId(req.ticket_id(), "ticket_id");
    return ToProto(ctx_.broker->PollQueue(req.ticket_id()));
  });
}

void BrokerService::CancelQueued(const CancelQueuedRequest& req) {
  ObserveRpc("TunerBrokerService.CancelQueued", "ticket_id", req.ticket_id(), [&] {
    RequireId(req.ticket_id(), "ticket_id");
    ctx_.broker->CancelQueued(req.ticket_id());
  });
}

GetSessionResponse BrokerService::GetSession(const GetSessionRequest& req) {
  return ObserveRpc("TunerBrokerService.GetSession", "session_id", req.session_id(), [&] {
    RequireId(req.session_id(), "session_id");
    GetSessionResponse resp;
    *resp.mutable_session() = ToProto(ctx_.broker->GetSession(req.session_id()));
    return resp;
  });
}

ListUserSessionsResponse BrokerService::ListUserSessions(const ListUserSessionsRequest& req) {
  return ObserveRpc("TunerBrokerService.ListUserSessions", "user_id", req.user_id(), [&] {
    RequireId(req.user_id(), "user_id");
    ListUserSessionsResponse resp;
    for (const auto& session : ctx_.broker->ListUserSessions(req.user_id())) {
      *resp.add_sessions() = ToProto(session);
    }
    return resp;
  });
}

ValidateStreamAccessResponse BrokerService::ValidateStreamAccess(const ValidateStreamAccessRequest& req) {
  return ObserveRpc("TunerBrokerService.ValidateStreamAccess", "session_id", req.session_id(), [&] {
    RequireId(req.session_id(), "session_id");
    const auto session = ctx_.broker->ValidateStreamAccess(req.session_id(), req.channel_key());

    ValidateStreamAccessResponse resp;
    resp.set_user_id(session.user_id);
    resp.set_stream_url(session.stream_url);
    return resp;
  });
}

} // namespace livetv::service
