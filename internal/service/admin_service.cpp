#include "admin_service.hpp"

#include <string>

#include "internal/core/tuner_broker.hpp"
#include "observe_rpc.hpp"
#include "proto_convert.hpp"

namespace livetv::service {

using namespace livetv::broker::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetStatusResponse AdminService::GetStatus(const GetStatusRequest&) {
  return ObserveRpc("BrokerAdminService.GetStatus", [&] {
    const auto status = ctx_.broker->GetStatus();

    GetStatusResponse resp;
    for (const auto& tuner : status.tuners) {
      *resp.add_tuners() = ToProto(tuner);
    }
    for (const auto& slot : status.credentials) {
      *resp.add_credentials() = ToProto(slot);
    }
    for (const auto& session : status.sessions) {
      *resp.add_active_sessions() = ToProto(session);
    }
    for (const auto& ticket : status.queued) {
      *resp.add_queued() = ToProto(ticket);
    }
    resp.set_queue_length(static_cast<uint32_t>(status.queued.size()));
    for (const auto& [channel, tuner_id] : status.channel_mapping) {
      (*resp.mutable_channel_mapping())[channel] = tuner_id;
    }
    return resp;
  });
}

void AdminService::MarkTunerFailed(const TunerRequest& req) {
  ObserveRpc("BrokerAdminService.MarkTunerFailed", "tuner_id", std::to_string(req.tuner_id()),
             [&] { ctx_.broker->MarkTunerFailed(req.tuner_id()); });
}

void AdminService::MarkTunerRecovered(const TunerRequest& req) {
  ObserveRpc("BrokerAdminService.MarkTunerRecovered", "tuner_id", std::to_string(req.tuner_id()),
             [&] { ctx_.broker->MarkTunerRecovered(req.tuner_id()); });
}

void AdminService::SetTunerMaintenance(const SetTunerMaintenanceRequest& req) {
  ObserveRpc("BrokerAdminService.SetTunerMaintenance", "tuner_id", std::to_string(req.tuner_id()),
             [&] { ctx_.broker->SetTunerMaintenance(req.tuner_id(), req.enabled()); });
}

ReleaseCountResponse AdminService::ReleaseUserSessions(const ReleaseUserSessionsRequest& req) {
  return ObserveRpc("BrokerAdminService.ReleaseUserSessions", "user_id", req.user_id(), [&] {
    ReleaseCountResponse resp;
    resp.set_released(ctx_.broker->ReleaseUserSessions(req.user_id()));
    return resp;
  });
}

ReleaseCountResponse AdminService::ReleaseCredentialSessions(const ReleaseCredentialSessionsRequest& req) {
  return ObserveRpc("BrokerAdminService.ReleaseCredentialSessions", "credential_id", std::to_string(req.credential_id()), [&] {
    ReleaseCountResponse resp;
    resp.set_released(ctx_.broker->ReleaseCredentialSessions(req.credential_id()));
    return resp;
  });
}

CredentialCapacity AdminService::GetCredentialCapacity(const GetCredentialCapacityRequest& req) {
  return ObserveRpc("BrokerAdminService.GetCredentialCapacity", "credential_id", std::to_string(req.credential_id()),
                    [&] { return ToProto(ctx_.broker->GetCredentialCapacity(req.credential_id())); });
}

SweepNowResponse AdminService::SweepNow(const SweepNowRequest&) {
  return ObserveRpc("BrokerAdminService.SweepNow", [&] {
    const auto report = ctx_.broker->Sweep();

    SweepNowResponse resp;
    resp.set_expired_sessions(report.expired_sessions);
    resp.set_expired_tickets(report.expired_tickets);
    resp.set_recovered_tuners(report.recovered_tuners);
    resp.set_promoted(report.promoted);
    return resp;
  });
}

ListViewingHistoryResponse AdminService::ListViewingHistory(const ListViewingHistoryRequest& req) {
  return ObserveRpc("BrokerAdminService.ListViewingHistory", "user_id", req.user_id(), [&] {
    ListViewingHistoryResponse resp;
    for (const auto& record : ctx_.broker->ListViewingHistory(req.user_id(), req.limit())) {
      *resp.add_entries() = ToProto(record);
    }
    return resp;
  });
}

} // namespace livetv::service
