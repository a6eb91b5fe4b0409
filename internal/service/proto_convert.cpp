#include "proto_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace livetv::service {

using namespace livetv::broker::v1;

ResourceKind ToProto(model::ResourceKind kind) {
  switch (kind) {
    case model::ResourceKind::kTuner:
      return RESOURCE_KIND_TUNER;
    case model::ResourceKind::kCredential:
      return RESOURCE_KIND_CREDENTIAL;
  }
  return RESOURCE_KIND_UNSPECIFIED;
}

TunerStatus ToProto(model::TunerStatus status) {
  switch (status) {
    case model::TunerStatus::kAvailable:
      return TUNER_STATUS_AVAILABLE;
    case model::TunerStatus::kBusy:
      return TUNER_STATUS_BUSY;
    case model::TunerStatus::kFailed:
      return TUNER_STATUS_FAILED;
    case model::TunerStatus::kMaintenance:
      return TUNER_STATUS_MAINTENANCE;
  }
  return TUNER_STATUS_UNSPECIFIED;
}

EndReason ToProto(model::EndReason reason) {
  // the domain enum mirrors the wire values 1..7
  return static_cast<EndReason>(static_cast<int>(reason));
}

model::ResourceKind FromProto(ResourceKind kind) {
  switch (kind) {
    case RESOURCE_KIND_UNSPECIFIED:
    case RESOURCE_KIND_TUNER:
      return model::ResourceKind::kTuner;
    case RESOURCE_KIND_CREDENTIAL:
      return model::ResourceKind::kCredential;
    default:
      throw util::InvalidArgument("unknown resource kind " + std::to_string(static_cast<int>(kind)));
  }
}

model::UserClass FromProto(UserClass user_class) {
  switch (user_class) {
    case USER_CLASS_ADMIN:
      return model::UserClass::kAdmin;
    case USER_CLASS_PREMIUM:
      return model::UserClass::kPremium;
    case USER_CLASS_UNSPECIFIED:
    case USER_CLASS_STANDARD:
    default:
      return model::UserClass::kStandard;
  }
}

StreamSession ToProto(const model::StreamSession& session) {
  StreamSession out;
  out.set_session_id(session.id);
  out.set_resource_kind(ToProto(session.resource_kind));
  out.set_resource_id(session.resource_id);
  out.set_channel_key(session.channel_key);
  out.set_user_id(session.user_id);
  out.set_stream_url(session.stream_url);
  *out.mutable_started_at()     = util::ToProto(session.started_at);
  *out.mutable_last_heartbeat() = util::ToProto(session.last_heartbeat);
  out.set_priority(session.priority);
  out.set_device_type(session.device_type);
  out.set_ip_address(session.ip_address);
  return out;
}

Tuner ToProto(const model::Tuner& tuner) {
  Tuner out;
  out.set_id(tuner.id);
  out.set_tuned_channel(tuner.tuned_channel);
  out.set_status(ToProto(tuner.status));
  for (const auto& id : tuner.session_ids) {
    out.add_session_ids(id);
  }
  out.set_failure_count(tuner.failure_count);
  *out.mutable_last_activity() = util::ToProto(tuner.last_activity);
  return out;
}

CredentialSlot ToProto(const model::CredentialSlot& slot) {
  CredentialSlot out;
  out.set_id(slot.id);
  out.set_provider_id(slot.provider_id);
  out.set_name(slot.name);
  out.set_max_connections(slot.max_connections);
  out.set_active_connections(slot.active_connections);
  return out;
}

QueueEntry ToProto(const core::QueuedTicket& ticket) {
  QueueEntry out;
  out.set_ticket_id(ticket.entry.ticket_id);
  out.set_user_id(ticket.entry.user_id);
  out.set_channel_key(ticket.entry.channel_key);
  out.set_kind(ToProto(ticket.entry.kind));
  out.set_provider_id(ticket.entry.provider_id);
  *out.mutable_requested_at() = util::ToProto(ticket.entry.requested_at);
  out.set_priority(ticket.entry.priority);
  out.set_position(ticket.position);
  return out;
}

CredentialCapacity ToProto(const core::CredentialCapacity& capacity) {
  CredentialCapacity out;
  out.set_credential_id(capacity.credential_id);
  out.set_max(capacity.max);
  out.set_used(capacity.used);
  out.set_available(capacity.available);
  return out;
}

ViewingHistoryEntry ToProto(const db::model::ViewingHistoryRecord& record) {
  ViewingHistoryEntry out;
  out.set_user_id(record.user_id);
  out.set_channel_key(record.channel_key);
  out.set_resource_kind(ToProto(record.resource_kind));
  out.set_resource_id(record.resource_id);
  *out.mutable_started_at() = util::ToProto(util::FromUnixMillis(record.started_at_ms));
  *out.mutable_ended_at()   = util::ToProto(util::FromUnixMillis(record.ended_at_ms));
  out.set_duration_seconds(record.duration_seconds);
  out.set_end_reason(ToProto(record.end_reason));
  out.set_device_type(record.device_type);
  out.set_ip_address(record.ip_address);
  return out;
}

AdmissionResponse ToProto(const core::Admission& admission) {
  AdmissionResponse out;
  if (admission.session) {
    *out.mutable_session() = ToProto(*admission.session);
    return out;
  }

  auto* queued = out.mutable_queued();
  queued->set_ticket_id(admission.ticket_id);
  queued->set_position(admission.position);
  queued->set_queue_length(admission.queue_length);
  return out;
}

} // namespace livetv::service
