#include "tuner_broker.hpp"

#include <algorithm>
#include <deque>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/token.hpp"

namespace livetv::core {

using model::EndReason;
using model::ResourceKind;
using observability::AdmissionOutcome;
using observability::IntField;
using observability::StringField;
using observability::UrlField;

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

// "7" or "10.1"
bool IsTunerChannel(const std::string& key) {
  const auto dot = key.find('.');
  const auto major = key.substr(0, dot);
  if (major.empty() || !std::all_of(major.begin(), major.end(), IsDigit)) return false;
  if (dot == std::string::npos) return true;

  const auto minor = key.substr(dot + 1);
  return !minor.empty() && std::all_of(minor.begin(), minor.end(), IsDigit);
}

bool IsCredentialChannel(const std::string& key) {
  if (key.empty() || key.size() > 64) return false;
  return std::all_of(key.begin(), key.end(), [](char c) {
    return IsDigit(c) || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '.' || c == '_' || c == '-';
  });
}

bool IsValidChannelKey(ResourceKind kind, const std::string& key) {
  return kind == ResourceKind::kTuner ? IsTunerChannel(key) : IsCredentialChannel(key);
}

db::model::SessionRecord ToRecord(const model::StreamSession& session) {
  db::model::SessionRecord record;
  record.id                = session.id;
  record.resource_kind     = session.resource_kind;
  record.resource_id       = session.resource_id;
  record.channel_key       = session.channel_key;
  record.user_id           = session.user_id;
  record.stream_url        = session.stream_url;
  record.started_at_ms     = util::ToUnixMillis(session.started_at);
  record.last_heartbeat_ms = util::ToUnixMillis(session.last_heartbeat);
  record.priority          = session.priority;
  record.device_type       = session.device_type;
  record.ip_address        = session.ip_address;
  record.queue_ticket      = session.queue_ticket;
  return record;
}

model::StreamSession FromRecord(const db::model::SessionRecord& record) {
  model::StreamSession session;
  session.id             = record.id;
  session.resource_kind  = record.resource_kind;
  session.resource_id    = record.resource_id;
  session.channel_key    = record.channel_key;
  session.user_id        = record.user_id;
  session.stream_url     = record.stream_url;
  session.started_at     = util::FromUnixMillis(record.started_at_ms);
  session.last_heartbeat = util::FromUnixMillis(record.last_heartbeat_ms);
  session.priority       = record.priority;
  session.device_type    = record.device_type;
  session.ip_address     = record.ip_address;
  session.queue_ticket   = record.queue_ticket;
  return session;
}

db::model::ViewingHistoryRecord ToHistory(const model::StreamSession& session, EndReason reason, util::TimePoint ended_at) {
  db::model::ViewingHistoryRecord record;
  record.user_id       = session.user_id;
  record.channel_key   = session.channel_key;
  record.resource_kind = session.resource_kind;
  record.resource_id   = session.resource_id;
  record.started_at_ms = util::ToUnixMillis(session.started_at);
  record.ended_at_ms   = util::ToUnixMillis(ended_at);
  record.duration_seconds =
      ended_at > session.started_at ? static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(ended_at - session.started_at).count()) : 0;
  record.end_reason  = reason;
  record.device_type = session.device_type;
  record.ip_address  = session.ip_address;
  return record;
}

std::string ResourceLabel(ResourceKind kind, uint64_t id) {
  return std::string(model::ToString(kind)) + ":" + std::to_string(id);
}

} // namespace

TunerBroker::TunerBroker(BrokerOptions options, std::shared_ptr<resolver::StreamUrlResolver> resolver, std::shared_ptr<db::Repository> repository,
                         util::ClockFn clock)
    : options_(std::move(options)),
      resolver_(std::move(resolver)),
      repository_(std::move(repository)),
      clock_(clock ? std::move(clock) : util::ClockFn(util::Now)),
      registry_(options_.tuner_count, options_.credentials),
      evictions_(options_.eviction_log_size) {
  if (!resolver_) {
    throw util::InvalidArgument("tuner broker requires a stream url resolver");
  }
  if (options_.stale_threshold.count() <= 0) {
    throw util::InvalidArgument("stale threshold must be positive");
  }
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

void TunerBroker::ValidateChannelKey(ResourceKind kind, const std::string& channel_key) {
  if (IsValidChannelKey(kind, channel_key)) return;

  if (kind == ResourceKind::kTuner) {
    throw util::InvalidChannel("invalid tuner channel '" + channel_key + "'; expected <major> or <major>.<minor>");
  }
  throw util::InvalidChannel("invalid stream id '" + channel_key + "'; expected 1-64 characters of [A-Za-z0-9._-]");
}

int32_t TunerBroker::PriorityFor(model::UserClass user_class, std::optional<int32_t> explicit_priority) const {
  if (explicit_priority) return *explicit_priority;

  switch (user_class) {
    case model::UserClass::kAdmin:
      return options_.priorities.admin;
    case model::UserClass::kPremium:
      return options_.priorities.premium;
    case model::UserClass::kStandard:
    default:
      return options_.priorities.standard;
  }
}

queue::WaitQueue& TunerBroker::QueueFor(const model::QueueEntry& entry) {
  if (entry.kind == ResourceKind::kTuner) return tuner_queue_;
  return credential_queues_[entry.provider_id];
}

const queue::WaitQueue* TunerBroker::FindQueueOf(const std::string& ticket_id) const {
  if (tuner_queue_.Find(ticket_id)) return &tuner_queue_;
  for (const auto& [_, queue] : credential_queues_) {
    if (queue.Find(ticket_id)) return &queue;
  }
  return nullptr;
}

void TunerBroker::ThrowGone(const std::string& session_id) const {
  if (auto reason = evictions_.Lookup(session_id); reason && model::IsRetryable(*reason)) {
    throw util::ResourceFailed("session " + session_id + " ended: " + std::string(model::ToString(*reason)) + "; request the channel again");
  }
  throw util::SessionNotFound("session not found: " + session_id);
}

template <typename Fn>
auto TunerBroker::Mutate(Fn&& fn) {
  using R = std::invoke_result_t<Fn&, util::TimePoint, Effects&>;

  Effects effects;
  if constexpr (std::is_void_v<R>) {
    {
      std::lock_guard lock(mutex_);
      const auto      now = clock_();
      fn(now, effects);
      PromoteLocked(now, effects);
      UpdateGaugesLocked();
    }
    ApplyEffects(std::move(effects));
  } else {
    std::optional<R> result;
    {
      std::lock_guard lock(mutex_);
      const auto      now = clock_();
      result.emplace(fn(now, effects));
      PromoteLocked(now, effects);
      UpdateGaugesLocked();
    }
    ApplyEffects(std::move(effects));
    return std::move(*result);
  }
}

// ------------------------------------------------------------------
// Critical-section primitives (mutex_ held)
// ------------------------------------------------------------------

model::StreamSession TunerBroker::CreateSessionLocked(const model::QueueEntry& want, ResourceKind kind, uint64_t resource_id, util::TimePoint now,
                                                      Effects& effects) {
  model::StreamSession session;
  session.id             = util::NewToken();
  session.resource_kind  = kind;
  session.resource_id    = resource_id;
  session.channel_key    = want.channel_key;
  session.user_id        = want.user_id;
  session.started_at     = now;
  session.last_heartbeat = now;
  session.priority       = want.priority;
  session.device_type    = want.device_type;
  session.ip_address     = want.ip_address;
  session.queue_ticket   = want.ticket_id;

  bool tuned = false;
  if (kind == ResourceKind::kTuner) {
    auto* tuner = registry_.FindTuner(static_cast<uint32_t>(resource_id));
    tuned       = tuner->session_ids.empty();
    // riders of a tuned tuner watch the stream it already carries
    for (const auto& rider_id : tuner->session_ids) {
      const auto* rider = sessions_.Find(rider_id);
      if (rider && !rider->stream_url.empty()) {
        session.stream_url = rider->stream_url;
        break;
      }
    }
    registry_.Attach(*tuner, session.id, now);
  } else {
    registry_.AcquireSlot(*registry_.FindCredential(resource_id));
  }

  const auto& inserted = sessions_.Insert(std::move(session));
  effects.granted.push_back({inserted, tuned});
  return inserted;
}

void TunerBroker::RenewLocked(model::StreamSession& session, util::TimePoint now) {
  session.last_heartbeat = now;
  if (session.resource_kind != ResourceKind::kTuner) return;
  if (auto* tuner = registry_.FindTuner(static_cast<uint32_t>(session.resource_id))) {
    tuner->last_activity = now;
  }
}

model::StreamSession* TunerBroker::FindRetriedLocked(const ChannelRequest& request) {
  auto* existing = sessions_.FindByUserChannel(request.user_id, request.channel_key, request.kind);
  if (!existing || request.kind != ResourceKind::kCredential || request.provider_id.empty()) return existing;

  // a request pinned to a provider only matches a session on that provider
  for (const auto& id : sessions_.ForUser(request.user_id)) {
    auto* session = sessions_.Find(id);
    if (!session || session->resource_kind != ResourceKind::kCredential || session->channel_key != request.channel_key) continue;
    const auto* slot = registry_.FindCredential(session->resource_id);
    if (slot && slot->provider_id == request.provider_id) return session;
  }
  return nullptr;
}

std::optional<model::StreamSession> TunerBroker::TryPlaceLocked(const model::QueueEntry& want, util::TimePoint now, Effects& effects) {
  if (want.kind == ResourceKind::kTuner) {
    if (auto* tuner = registry_.FindSharableTuner(want.channel_key)) {
      auto session = CreateSessionLocked(want, ResourceKind::kTuner, tuner->id, now, effects);
      observability::Metrics::Instance().RecordAdmission(ResourceKind::kTuner, AdmissionOutcome::kShared);
      LIVETV_LOG_INFO("Tuner shared",
                      {StringField("session_id", session.id), StringField("user_id", want.user_id), StringField("channel", want.channel_key),
                       IntField("tuner_id", tuner->id), IntField("riders", static_cast<int64_t>(tuner->session_ids.size()))});
      return session;
    }

    auto* tuner = registry_.FindAvailableTuner();
    if (!tuner) return std::nullopt;

    registry_.Tune(*tuner, want.channel_key, now);
    auto session = CreateSessionLocked(want, ResourceKind::kTuner, tuner->id, now, effects);
    observability::Metrics::Instance().RecordAdmission(ResourceKind::kTuner, AdmissionOutcome::kAllocated);
    LIVETV_LOG_INFO("Tuner allocated", {StringField("session_id", session.id), StringField("user_id", want.user_id),
                                        StringField("channel", want.channel_key), IntField("tuner_id", tuner->id)});
    return session;
  }

  auto* slot = registry_.PickCredential(want.provider_id);
  if (!slot) return std::nullopt;

  auto session = CreateSessionLocked(want, ResourceKind::kCredential, slot->id, now, effects);
  observability::Metrics::Instance().RecordAdmission(ResourceKind::kCredential, AdmissionOutcome::kAllocated);
  LIVETV_LOG_INFO("Credential slot allocated",
                  {StringField("session_id", session.id), StringField("user_id", want.user_id), StringField("channel", want.channel_key),
                   IntField("credential_id", static_cast<int64_t>(slot->id)), IntField("active", slot->active_connections),
                   IntField("max", slot->max_connections)});
  return session;
}

bool TunerBroker::EndSessionLocked(const std::string& session_id, EndReason reason, util::TimePoint now, Effects& effects) {
  auto removed = sessions_.Remove(session_id);
  if (!removed) return false;

  auto& session = *removed;
  if (session.resource_kind == ResourceKind::kTuner) {
    if (auto* tuner = registry_.FindTuner(static_cast<uint32_t>(session.resource_id))) {
      registry_.Detach(*tuner, session.id, now);
    }
  } else if (auto* slot = registry_.FindCredential(session.resource_id)) {
    registry_.ReleaseSlot(*slot);
  }

  evictions_.Record(session.id, reason);
  if (!session.queue_ticket.empty()) {
    promoted_.erase(session.queue_ticket);
    evictions_.Record(session.queue_ticket, reason);
  }

  observability::Metrics::Instance().RecordSessionEnded(reason, std::chrono::duration_cast<std::chrono::seconds>(now - session.started_at));
  LIVETV_LOG_INFO("Session ended", {StringField("session_id", session.id), StringField("user_id", session.user_id),
                                    StringField("channel", session.channel_key),
                                    StringField("resource", ResourceLabel(session.resource_kind, session.resource_id)),
                                    StringField("reason", model::ToString(reason))});

  effects.ended.push_back({std::move(session), reason, now});
  return true;
}

void TunerBroker::EvictLocked(const std::vector<std::string>& session_ids, EndReason reason, util::TimePoint now, Effects& effects) {
  for (const auto& id : session_ids) {
    EndSessionLocked(id, reason, now, effects);
  }
}

void TunerBroker::PenalizeTunerLocked(uint32_t tuner_id, util::TimePoint now, Effects& effects) {
  auto* tuner = registry_.FindTuner(tuner_id);
  if (!tuner || model::IsOutOfService(tuner->status)) return;

  if (tuner->failure_count + 1 < options_.max_failures) {
    tuner->failure_count++;
    return;
  }

  auto riders = registry_.MarkFailed(*tuner, now);
  observability::Metrics::Instance().RecordTunerFailed(tuner_id);
  LIVETV_LOG_WARN("Tuner marked failed after repeated stream setup failures",
                  {IntField("tuner_id", tuner_id), IntField("failure_count", tuner->failure_count),
                   IntField("evicted", static_cast<int64_t>(riders.size()))});
  EvictLocked(riders, EndReason::kResourceFailed, now, effects);
}

uint32_t TunerBroker::PromoteTunersLocked(util::TimePoint now, Effects& effects) {
  uint32_t promoted = 0;
  while (const auto* head = tuner_queue_.Head()) {
    auto* tuner = registry_.FindSharableTuner(head->channel_key);
    if (!tuner) {
      tuner = registry_.FindAvailableTuner();
      if (!tuner) break;
      registry_.Tune(*tuner, head->channel_key, now);
    }

    // everyone waiting for this channel rides the same tuner
    const auto channel = head->channel_key;
    for (const auto& entry : tuner_queue_.TakeForChannel(channel)) {
      auto session               = CreateSessionLocked(entry, ResourceKind::kTuner, tuner->id, now, effects);
      promoted_[entry.ticket_id] = session.id;
      ++promoted;

      observability::Metrics::Instance().RecordAdmission(ResourceKind::kTuner, AdmissionOutcome::kPromoted);
      LIVETV_LOG_INFO("Queued request promoted", {StringField("ticket_id", entry.ticket_id), StringField("session_id", session.id),
                                                   StringField("user_id", entry.user_id), StringField("channel", channel),
                                                   IntField("tuner_id", tuner->id)});
    }
  }
  return promoted;
}

uint32_t TunerBroker::PromoteCredentialsLocked(util::TimePoint now, Effects& effects) {
  uint32_t promoted = 0;
  for (;;) {
    queue::WaitQueue*      best      = nullptr;
    model::CredentialSlot* best_slot = nullptr;
    for (auto& [provider_id, queue] : credential_queues_) {
      const auto* head = queue.Head();
      if (!head) continue;

      auto* slot = registry_.PickCredential(provider_id);
      if (!slot) continue;

      if (!best || queue::KeyOf(*head) < queue::KeyOf(*best->Head())) {
        best      = &queue;
        best_slot = slot;
      }
    }
    if (!best) break;

    auto entry                 = *best->PopHead();
    auto session               = CreateSessionLocked(entry, ResourceKind::kCredential, best_slot->id, now, effects);
    promoted_[entry.ticket_id] = session.id;
    ++promoted;

    observability::Metrics::Instance().RecordAdmission(ResourceKind::kCredential, AdmissionOutcome::kPromoted);
    LIVETV_LOG_INFO("Queued request promoted", {StringField("ticket_id", entry.ticket_id), StringField("session_id", session.id),
                                                 StringField("user_id", entry.user_id), StringField("channel", entry.channel_key),
                                                 IntField("credential_id", static_cast<int64_t>(best_slot->id))});
  }

  std::erase_if(credential_queues_, [](const auto& item) { return item.second.Empty(); });
  return promoted;
}

uint32_t TunerBroker::PromoteLocked(util::TimePoint now, Effects& effects) {
  return PromoteTunersLocked(now, effects) + PromoteCredentialsLocked(now, effects);
}

void TunerBroker::UpdateGaugesLocked() const {
  observability::BrokerGauges gauges;
  gauges.active_sessions = static_cast<int64_t>(sessions_.Size());
  gauges.queue_depth     = static_cast<int64_t>(tuner_queue_.Size());
  for (const auto& [_, queue] : credential_queues_) {
    gauges.queue_depth += static_cast<int64_t>(queue.Size());
  }

  for (const auto& tuner : registry_.Tuners()) {
    if (tuner.status == model::TunerStatus::kBusy) ++gauges.busy_tuners;
    if (tuner.status == model::TunerStatus::kFailed) ++gauges.failed_tuners;
  }
  for (const auto& slot : registry_.Credentials()) {
    gauges.credential_connections += slot.active_connections;
  }

  observability::Metrics::Instance().Publish(gauges);
}

// ------------------------------------------------------------------
// After the critical section
// ------------------------------------------------------------------

void TunerBroker::ApplyEffects(Effects effects) {
  std::deque<Grant> grants(std::make_move_iterator(effects.granted.begin()), std::make_move_iterator(effects.granted.end()));
  std::deque<Ended>                ended(std::make_move_iterator(effects.ended.begin()), std::make_move_iterator(effects.ended.end()));

  // a failed grant can end or promote further sessions
  while (!grants.empty() || !ended.empty()) {
    while (!ended.empty()) {
      PersistEnd(ended.front());
      ended.pop_front();
    }
    if (grants.empty()) break;

    auto follow_up = FinalizeGrant(grants.front());
    grants.pop_front();
    for (auto& grant : follow_up.granted) grants.push_back(std::move(grant));
    for (auto& item : follow_up.ended) ended.push_back(std::move(item));
  }
}

TunerBroker::Effects TunerBroker::FinalizeGrant(const Grant& grant) {
  const auto& granted = grant.session;

  std::string error;
  bool        resolver_failed = false;

  std::string url = granted.stream_url;
  if (url.empty()) {
    try {
      url = resolver_->Resolve(granted);
    } catch (const std::exception& e) {
      error           = e.what();
      resolver_failed = true;
    }
  }

  if (!resolver_failed) {
    std::lock_guard persist_lock(persist_mutex_);

    std::optional<model::StreamSession> live;
    {
      std::lock_guard lock(mutex_);
      auto*           session = sessions_.Find(granted.id);
      if (!session) return {};
      session->stream_url = url;
      live                = *session;
    }
    LIVETV_LOG_DEBUG("Stream url resolved", {StringField("session_id", granted.id), UrlField("stream_url", url)});
    if (!repository_) return {};

    // one retry when the store reports lock contention
    for (int attempt = 0; attempt < 2; ++attempt) {
      try {
        auto tx     = repository_->Begin();
        auto result = repository_->UpsertSession(*tx, ToRecord(*live));
        if (result) {
          tx->Commit();
          return {};
        }
        error = std::string(db::ToString(result.code)) + ": " + result.message;
        if (!result.Transient()) break;
      } catch (const std::exception& e) {
        error = e.what();
        break;
      }
    }
  }

  LIVETV_LOG_WARN("Stream setup failed", {StringField("session_id", granted.id), StringField("channel", granted.channel_key),
                                          StringField("resource", ResourceLabel(granted.resource_kind, granted.resource_id)),
                                          StringField("stage", resolver_failed ? "resolve" : "persist"), StringField("error", error)});

  Effects         effects;
  std::lock_guard lock(mutex_);
  const auto      now = clock_();
  if (!EndSessionLocked(granted.id, EndReason::kStreamSetupFailed, now, effects)) return effects;

  if (resolver_failed && grant.tuned) {
    PenalizeTunerLocked(static_cast<uint32_t>(granted.resource_id), now, effects);
  }
  PromoteLocked(now, effects);
  UpdateGaugesLocked();
  return effects;
}

void TunerBroker::PersistEnd(const Ended& ended) {
  if (!repository_) return;

  std::lock_guard persist_lock(persist_mutex_);
  try {
    auto tx      = repository_->Begin();
    auto deleted = repository_->DeleteSession(*tx, ended.session.id);
    if (!deleted) {
      LIVETV_LOG_ERROR("Failed to delete session row", {StringField("session_id", ended.session.id), StringField("code", db::ToString(deleted.code)), StringField("error", deleted.message)});
      return;
    }

    auto history  = ToHistory(ended.session, ended.reason, ended.ended_at);
    auto inserted = repository_->InsertViewingHistory(*tx, history);
    if (!inserted) {
      LIVETV_LOG_ERROR("Failed to record viewing history", {StringField("session_id", ended.session.id), StringField("code", db::ToString(inserted.code)), StringField("error", inserted.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    LIVETV_LOG_ERROR("Failed to persist ended session", {StringField("session_id", ended.session.id), StringField("error", e.what())});
  }
}

void TunerBroker::PersistTouch(const std::string& session_id, util::TimePoint at) {
  if (!repository_) return;

  std::lock_guard persist_lock(persist_mutex_);
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->TouchSession(*tx, session_id, util::ToUnixMillis(at));
    if (result) {
      tx->Commit();
      return;
    }
    if (result.code == db::ErrorCode::NotFound) {
      LIVETV_LOG_DEBUG("Heartbeat for session without a stored row", {StringField("session_id", session_id)});
      return;
    }
    LIVETV_LOG_WARN("Failed to persist heartbeat", {StringField("session_id", session_id), StringField("error", result.message)});
  } catch (const std::exception& e) {
    LIVETV_LOG_WARN("Failed to persist heartbeat", {StringField("session_id", session_id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Viewer operations
// ------------------------------------------------------------------

Admission TunerBroker::RequestChannel(const ChannelRequest& request) {
  if (request.user_id.empty()) {
    throw util::InvalidArgument("request channel: user_id is required");
  }
  ValidateChannelKey(request.kind, request.channel_key);

  Admission   admission;
  Effects     effects;
  std::string granted_id;
  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_();

    if (request.kind == ResourceKind::kTuner && !registry_.HasTuners()) {
      throw util::NoCapacityConfigured("no tuners configured");
    }
    if (request.kind == ResourceKind::kCredential && !registry_.HasCredentials(request.provider_id)) {
      throw util::NoCapacityConfigured(request.provider_id.empty() ? std::string("no credential slots configured")
                                                                   : "no credential slots configured for provider " + request.provider_id);
    }

    // retried requests never take a second resource
    if (auto* existing = FindRetriedLocked(request)) {
      RenewLocked(*existing, now);
      admission.session = *existing;
      return admission;
    }

    model::QueueEntry want;
    want.user_id      = request.user_id;
    want.channel_key  = request.channel_key;
    want.kind         = request.kind;
    want.provider_id  = request.kind == ResourceKind::kCredential ? request.provider_id : std::string();
    want.requested_at = now;
    want.priority     = PriorityFor(request.user_class, request.priority);
    want.device_type  = request.device_type;
    want.ip_address   = request.ip_address;

    auto& queue = QueueFor(want);
    if (const auto* queued = queue.FindByUserChannel(request.user_id, request.channel_key)) {
      admission.ticket_id    = queued->ticket_id;
      admission.position     = queue.PositionOf(queued->ticket_id).value_or(0);
      admission.queue_length = static_cast<uint32_t>(queue.Size());
      return admission;
    }

    want.sequence = ++sequence_;
    if (auto session = TryPlaceLocked(want, now, effects)) {
      granted_id = session->id;
    } else {
      want.ticket_id         = util::NewToken();
      admission.ticket_id    = want.ticket_id;
      admission.position     = queue.Push(want);
      admission.queue_length = static_cast<uint32_t>(queue.Size());

      observability::Metrics::Instance().RecordAdmission(request.kind, AdmissionOutcome::kQueued);
      LIVETV_LOG_INFO("Request queued", {StringField("ticket_id", want.ticket_id), StringField("user_id", want.user_id),
                                         StringField("channel", want.channel_key), StringField("kind", model::ToString(want.kind)),
                                         IntField("priority", want.priority), IntField("position", admission.position)});
    }
    UpdateGaugesLocked();
  }

  if (granted_id.empty()) return admission;

  ApplyEffects(std::move(effects));

  std::lock_guard lock(mutex_);
  if (const auto* session = sessions_.Find(granted_id)) {
    admission.session = *session;
    return admission;
  }
  ThrowGone(granted_id);
}

void TunerBroker::Heartbeat(const std::string& session_id) {
  util::TimePoint now;
  {
    std::lock_guard lock(mutex_);
    auto*           session = sessions_.Find(session_id);
    if (!session) ThrowGone(session_id);

    now = clock_();
    RenewLocked(*session, now);
  }
  PersistTouch(session_id, now);
}

void TunerBroker::ReleaseSession(const std::string& session_id, const std::string& requester_user_id) {
  Mutate([&](util::TimePoint now, Effects& effects) {
    const auto* session = sessions_.Find(session_id);
    if (!session) return;

    if (!requester_user_id.empty() && requester_user_id != session->user_id) {
      throw util::PermissionDenied("session " + session_id + " belongs to another user");
    }
    EndSessionLocked(session_id, EndReason::kReleased, now, effects);
  });
}

Admission TunerBroker::PollQueue(const std::string& ticket_id) {
  std::lock_guard lock(mutex_);

  Admission admission;
  admission.ticket_id = ticket_id;

  if (const auto* queue = FindQueueOf(ticket_id)) {
    admission.position     = queue->PositionOf(ticket_id).value_or(0);
    admission.queue_length = static_cast<uint32_t>(queue->Size());
    return admission;
  }

  if (auto it = promoted_.find(ticket_id); it != promoted_.end()) {
    if (const auto* session = sessions_.Find(it->second)) {
      admission.session = *session;
      return admission;
    }
  }

  if (auto reason = evictions_.Lookup(ticket_id)) {
    if (*reason == EndReason::kQueueTimeout) {
      throw util::QueueTimeout("ticket " + ticket_id + " timed out in the queue");
    }
    if (model::IsRetryable(*reason)) {
      throw util::ResourceFailed("ticket " + ticket_id + " session ended: " + std::string(model::ToString(*reason)) + "; request the channel again");
    }
    throw util::NotFound("ticket " + ticket_id + " is no longer active (" + std::string(model::ToString(*reason)) + ")");
  }
  throw util::NotFound("ticket not found: " + ticket_id);
}

void TunerBroker::CancelQueued(const std::string& ticket_id) {
  Mutate([&](util::TimePoint now, Effects& effects) {
    bool cancelled = tuner_queue_.Cancel(ticket_id);
    for (auto& [_, queue] : credential_queues_) {
      if (cancelled) break;
      cancelled = queue.Cancel(ticket_id);
    }

    if (cancelled) {
      evictions_.Record(ticket_id, EndReason::kReleased);
      LIVETV_LOG_INFO("Queued request cancelled", {StringField("ticket_id", ticket_id)});
      return;
    }

    // promoted while the viewer was leaving
    if (auto it = promoted_.find(ticket_id); it != promoted_.end()) {
      const auto session_id = it->second;
      EndSessionLocked(session_id, EndReason::kReleased, now, effects);
    }
  });
}

model::StreamSession TunerBroker::GetSession(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  const auto*     session = sessions_.Find(session_id);
  if (!session) {
    throw util::SessionNotFound("session not found: " + session_id);
  }
  return *session;
}

std::vector<model::StreamSession> TunerBroker::ListUserSessions(const std::string& user_id) const {
  std::lock_guard lock(mutex_);

  std::vector<model::StreamSession> out;
  for (const auto& id : sessions_.ForUser(user_id)) {
    if (const auto* session = sessions_.Find(id)) out.push_back(*session);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.started_at < b.started_at; });
  return out;
}

model::StreamSession TunerBroker::ValidateStreamAccess(const std::string& session_id, const std::string& channel_key) {
  util::TimePoint      now;
  model::StreamSession validated;
  {
    std::lock_guard lock(mutex_);
    auto*           session = sessions_.Find(session_id);
    if (!session) {
      throw util::SessionNotFound("session not found: " + session_id);
    }
    if (!channel_key.empty() && channel_key != session->channel_key) {
      throw util::PermissionDenied("session " + session_id + " is not watching channel " + channel_key);
    }

    now = clock_();
    RenewLocked(*session, now);
    validated = *session;
  }
  PersistTouch(session_id, now);
  return validated;
}

// ------------------------------------------------------------------
// Administration
// ------------------------------------------------------------------

void TunerBroker::MarkTunerFailed(uint32_t tuner_id) {
  Mutate([&](util::TimePoint now, Effects& effects) {
    auto* tuner = registry_.FindTuner(tuner_id);
    if (!tuner) throw util::NotFound("tuner not found: " + std::to_string(tuner_id));

    auto riders = registry_.MarkFailed(*tuner, now);
    observability::Metrics::Instance().RecordTunerFailed(tuner_id);
    LIVETV_LOG_WARN("Tuner marked failed", {IntField("tuner_id", tuner_id), IntField("failure_count", tuner->failure_count),
                                            IntField("evicted", static_cast<int64_t>(riders.size()))});
    EvictLocked(riders, EndReason::kResourceFailed, now, effects);
  });
}

void TunerBroker::MarkTunerRecovered(uint32_t tuner_id) {
  Mutate([&](util::TimePoint now, Effects&) {
    auto* tuner = registry_.FindTuner(tuner_id);
    if (!tuner) throw util::NotFound("tuner not found: " + std::to_string(tuner_id));
    if (!model::IsOutOfService(tuner->status)) return;

    registry_.Recover(*tuner, now);
    LIVETV_LOG_INFO("Tuner recovered", {IntField("tuner_id", tuner_id)});
  });
}

void TunerBroker::SetTunerMaintenance(uint32_t tuner_id, bool enabled) {
  Mutate([&](util::TimePoint now, Effects& effects) {
    auto* tuner = registry_.FindTuner(tuner_id);
    if (!tuner) throw util::NotFound("tuner not found: " + std::to_string(tuner_id));

    if (enabled) {
      auto riders = registry_.EnterMaintenance(*tuner, now);
      LIVETV_LOG_INFO("Tuner entered maintenance", {IntField("tuner_id", tuner_id), IntField("evicted", static_cast<int64_t>(riders.size()))});
      EvictLocked(riders, EndReason::kMaintenance, now, effects);
      return;
    }

    if (tuner->status == model::TunerStatus::kFailed) {
      throw util::InvalidState("tuner " + std::to_string(tuner_id) + " is failed; mark it recovered instead");
    }
    if (tuner->status != model::TunerStatus::kMaintenance) return;

    registry_.Recover(*tuner, now);
    LIVETV_LOG_INFO("Tuner left maintenance", {IntField("tuner_id", tuner_id)});
  });
}

uint32_t TunerBroker::ReleaseUserSessions(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::InvalidArgument("release user sessions: user_id is required");
  }

  return Mutate([&](util::TimePoint now, Effects& effects) {
    uint32_t released = 0;
    for (const auto& id : sessions_.ForUser(user_id)) {
      if (EndSessionLocked(id, EndReason::kAdmin, now, effects)) ++released;
    }
    return released;
  });
}

uint32_t TunerBroker::ReleaseCredentialSessions(uint64_t credential_id) {
  return Mutate([&](util::TimePoint now, Effects& effects) {
    if (!registry_.FindCredential(credential_id)) {
      throw util::NotFound("credential not found: " + std::to_string(credential_id));
    }

    uint32_t released = 0;
    for (const auto& id : sessions_.ForResource(ResourceKind::kCredential, credential_id)) {
      if (EndSessionLocked(id, EndReason::kAdmin, now, effects)) ++released;
    }
    return released;
  });
}

CredentialCapacity TunerBroker::GetCredentialCapacity(uint64_t credential_id) const {
  std::lock_guard lock(mutex_);
  for (const auto& slot : registry_.Credentials()) {
    if (slot.id != credential_id) continue;
    return {slot.id, slot.max_connections, slot.active_connections, slot.Spare()};
  }
  throw util::NotFound("credential not found: " + std::to_string(credential_id));
}

BrokerStatus TunerBroker::GetStatus() const {
  std::lock_guard lock(mutex_);

  BrokerStatus status;
  status.tuners          = registry_.Tuners();
  status.credentials     = registry_.Credentials();
  status.sessions        = sessions_.Snapshot();
  status.channel_mapping = registry_.ChannelMapping();

  auto append = [&status](const queue::WaitQueue& queue) {
    uint32_t position = 0;
    for (auto& entry : queue.Snapshot()) {
      status.queued.push_back({std::move(entry), ++position});
    }
  };
  append(tuner_queue_);
  for (const auto& [_, queue] : credential_queues_) {
    append(queue);
  }
  return status;
}

std::vector<db::model::ViewingHistoryRecord> TunerBroker::ListViewingHistory(const std::string& user_id, uint32_t limit) {
  if (!repository_) return {};

  std::lock_guard persist_lock(persist_mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->ListViewingHistory(*tx, user_id, limit);
  tx->Commit();
  return records;
}

// ------------------------------------------------------------------
// Liveness
// ------------------------------------------------------------------

SweepReport TunerBroker::Sweep() {
  SweepReport report;
  Mutate([&](util::TimePoint now, Effects& effects) {
    for (const auto& id : sessions_.Stale(now, options_.stale_threshold)) {
      if (EndSessionLocked(id, EndReason::kExpired, now, effects)) ++report.expired_sessions;
    }

    const auto cutoff = now - options_.queue_timeout;
    auto       expire = [&](queue::WaitQueue& queue) {
      for (const auto& entry : queue.RemoveOlderThan(cutoff)) {
        evictions_.Record(entry.ticket_id, EndReason::kQueueTimeout);
        observability::Metrics::Instance().RecordQueueTimeout(entry.kind);
        LIVETV_LOG_INFO("Queued request timed out",
                        {StringField("ticket_id", entry.ticket_id), StringField("user_id", entry.user_id), StringField("channel", entry.channel_key)});
        ++report.expired_tickets;
      }
    };
    expire(tuner_queue_);
    for (auto& [_, queue] : credential_queues_) {
      expire(queue);
    }

    if (options_.failed_cooldown.count() > 0) {
      for (auto* tuner : registry_.FailedTuners()) {
        if (now - tuner->failed_at < options_.failed_cooldown) continue;
        registry_.Recover(*tuner, now);
        LIVETV_LOG_INFO("Tuner recovered after cooldown", {IntField("tuner_id", tuner->id)});
        ++report.recovered_tuners;
      }
    }

    report.promoted = PromoteLocked(now, effects);
  });

  if (report.Changed()) {
    LIVETV_LOG_INFO("Liveness sweep", {IntField("expired_sessions", report.expired_sessions), IntField("expired_tickets", report.expired_tickets),
                                       IntField("recovered_tuners", report.recovered_tuners), IntField("promoted", report.promoted)});
  }
  return report;
}

uint32_t TunerBroker::RestoreSessions() {
  if (!repository_) return 0;

  std::vector<db::model::SessionRecord> records;
  {
    std::lock_guard persist_lock(persist_mutex_);
    auto            tx = repository_->Begin();
    records            = repository_->ListSessions(*tx);
    tx->Commit();
  }

  uint32_t                 restored = 0;
  std::vector<std::string> dropped;
  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_();

    for (const auto& record : records) {
      auto session = FromRecord(record);

      bool compatible = !session.user_id.empty() && IsValidChannelKey(session.resource_kind, session.channel_key) &&
                        !session::SessionTable::IsStale(session, now, options_.stale_threshold) && !sessions_.Find(session.id);
      if (compatible && session.resource_kind == ResourceKind::kTuner) {
        auto* tuner = registry_.FindTuner(static_cast<uint32_t>(session.resource_id));
        if (tuner && tuner->status == model::TunerStatus::kAvailable) {
          registry_.Tune(*tuner, session.channel_key, now);
        }
        compatible = tuner && tuner->status == model::TunerStatus::kBusy && tuner->tuned_channel == session.channel_key;
        if (compatible) registry_.Attach(*tuner, session.id, now);
      } else if (compatible) {
        auto* slot = registry_.FindCredential(session.resource_id);
        compatible = slot && slot->Spare() > 0;
        if (compatible) registry_.AcquireSlot(*slot);
      }

      if (!compatible) {
        dropped.push_back(session.id);
        continue;
      }
      if (!session.queue_ticket.empty()) {
        promoted_[session.queue_ticket] = session.id;
      }
      sessions_.Insert(std::move(session));
      ++restored;
    }
    UpdateGaugesLocked();
  }

  if (!dropped.empty()) {
    std::lock_guard persist_lock(persist_mutex_);
    try {
      auto tx = repository_->Begin();
      for (const auto& id : dropped) {
        auto result = repository_->DeleteSession(*tx, id);
        if (!result) {
          LIVETV_LOG_WARN("Failed to drop stale session row", {StringField("session_id", id), StringField("error", result.message)});
        }
      }
      tx->Commit();
    } catch (const std::exception& e) {
      LIVETV_LOG_ERROR("Failed to drop stale session rows", {StringField("error", e.what())});
    }
  }

  LIVETV_LOG_INFO("Sessions restored", {IntField("restored", restored), IntField("dropped", static_cast<int64_t>(dropped.size()))});
  return restored;
}

} // namespace livetv::core
