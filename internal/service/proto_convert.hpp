#pragma once

#include "internal/core/tuner_broker.hpp"
#include "internal/db/model/viewing_history_record.hpp"
#include "livetv/broker/v1.hpp"

namespace livetv::service {

/*
  Domain <-> wire conversions shared by the broker and admin services.
*/

livetv::broker::v1::ResourceKind ToProto(model::ResourceKind kind);
livetv::broker::v1::TunerStatus  ToProto(model::TunerStatus status);
livetv::broker::v1::EndReason    ToProto(model::EndReason reason);

// Unspecified kinds mean tuner; unknown values are rejected.
model::ResourceKind FromProto(livetv::broker::v1::ResourceKind kind);
model::UserClass    FromProto(livetv::broker::v1::UserClass user_class);

livetv::broker::v1::StreamSession       ToProto(const model::StreamSession& session);
livetv::broker::v1::Tuner               ToProto(const model::Tuner& tuner);
livetv::broker::v1::CredentialSlot      ToProto(const model::CredentialSlot& slot);
livetv::broker::v1::QueueEntry          ToProto(const core::QueuedTicket& ticket);
livetv::broker::v1::CredentialCapacity  ToProto(const core::CredentialCapacity& capacity);
livetv::broker::v1::ViewingHistoryEntry ToProto(const db::model::ViewingHistoryRecord& record);
livetv::broker::v1::AdmissionResponse   ToProto(const core::Admission& admission);

} // namespace livetv::service
