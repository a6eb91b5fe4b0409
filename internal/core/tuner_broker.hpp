#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/credential_slot.hpp"
#include "internal/model/queue_entry.hpp"
#include "internal/model/resource_kind.hpp"
#include "internal/model/stream_session.hpp"
#include "internal/model/tuner.hpp"
#include "internal/queue/wait_queue.hpp"
#include "internal/registry/resource_registry.hpp"
#include "internal/resolver/stream_url_resolver.hpp"
#include "internal/session/eviction_log.hpp"
#include "internal/session/session_table.hpp"
#include "internal/util/time.hpp"

namespace livetv::core {

// Lower number is served first.
struct PriorityMap {
  int32_t admin    = 0;
  int32_t premium  = 50;
  int32_t standard = 100;
};

struct BrokerOptions {
  uint32_t                           tuner_count = 0;
  std::vector<model::CredentialSlot> credentials;

  std::chrono::milliseconds stale_threshold{std::chrono::seconds(90)};
  std::chrono::milliseconds queue_timeout{std::chrono::minutes(5)};
  std::chrono::milliseconds failed_cooldown{0}; // zero keeps recovery manual

  uint32_t    max_failures      = 3;
  std::size_t eviction_log_size = 1024;

  PriorityMap priorities;
};

struct ChannelRequest {
  std::string            user_id;
  std::string            channel_key;
  model::ResourceKind    kind       = model::ResourceKind::kTuner;
  model::UserClass       user_class = model::UserClass::kStandard;
  std::optional<int32_t> priority; // overrides user_class
  std::string            provider_id;
  std::string            device_type;
  std::string            ip_address;
};

// Either a granted session or a queue ticket.
struct Admission {
  std::optional<model::StreamSession> session;

  std::string ticket_id;
  uint32_t    position     = 0;
  uint32_t    queue_length = 0;

  bool Granted() const {
    return session.has_value();
  }
};

struct QueuedTicket {
  model::QueueEntry entry;
  uint32_t          position = 0;
};

struct CredentialCapacity {
  uint64_t credential_id = 0;
  uint32_t max           = 0;
  uint32_t used          = 0;
  uint32_t available     = 0;
};

struct BrokerStatus {
  std::vector<model::Tuner>          tuners;
  std::vector<model::CredentialSlot> credentials;
  std::vector<model::StreamSession>  sessions;
  std::vector<QueuedTicket>          queued;
  std::map<std::string, uint32_t>    channel_mapping;
};

struct SweepReport {
  uint32_t expired_sessions = 0;
  uint32_t expired_tickets  = 0;
  uint32_t recovered_tuners = 0;
  uint32_t promoted         = 0;

  bool Changed() const {
    return expired_sessions + expired_tickets + recovered_tuners + promoted > 0;
  }
};

/*
  Admission controller for tuners and credential slots.

  One mutex serializes the registry, the session table, the wait queues,
  the promotion map and the eviction log. Stream URL resolution and
  repository writes happen after the critical section: a grant is
  reserved first and rolled back if either external step fails.
*/
class TunerBroker {
 public:
  TunerBroker(BrokerOptions options, std::shared_ptr<resolver::StreamUrlResolver> resolver, std::shared_ptr<db::Repository> repository,
              util::ClockFn clock = util::Now);

  // ---------------------------------------------------------------------
  // Viewer operations
  // ---------------------------------------------------------------------

  Admission RequestChannel(const ChannelRequest& request);

  void Heartbeat(const std::string& session_id);

  // Unknown ids are a no-op. A non-empty requester must own the session.
  void ReleaseSession(const std::string& session_id, const std::string& requester_user_id = {});

  Admission PollQueue(const std::string& ticket_id);
  void      CancelQueued(const std::string& ticket_id);

  model::StreamSession              GetSession(const std::string& session_id) const;
  std::vector<model::StreamSession> ListUserSessions(const std::string& user_id) const;

  // Returns the session (and so its owner) and renews the heartbeat.
  model::StreamSession ValidateStreamAccess(const std::string& session_id, const std::string& channel_key);

  // ---------------------------------------------------------------------
  // Administration
  // ---------------------------------------------------------------------

  void MarkTunerFailed(uint32_t tuner_id);
  void MarkTunerRecovered(uint32_t tuner_id);
  void SetTunerMaintenance(uint32_t tuner_id, bool enabled);

  uint32_t ReleaseUserSessions(const std::string& user_id);
  uint32_t ReleaseCredentialSessions(uint64_t credential_id);

  CredentialCapacity GetCredentialCapacity(uint64_t credential_id) const;
  BrokerStatus       GetStatus() const;

  std::vector<db::model::ViewingHistoryRecord> ListViewingHistory(const std::string& user_id, uint32_t limit);

  // ---------------------------------------------------------------------
  // Liveness
  // ---------------------------------------------------------------------

  SweepReport Sweep();

  // Re-attaches persisted sessions; returns how many were kept.
  uint32_t RestoreSessions();

  int32_t PriorityFor(model::UserClass user_class, std::optional<int32_t> explicit_priority) const;

  static void ValidateChannelKey(model::ResourceKind kind, const std::string& channel_key);

 private:
  struct Ended {
    model::StreamSession session;
    model::EndReason     reason = model::EndReason::kReleased;
    util::TimePoint      ended_at{};
  };

  // tuned is set for the grant that tuned its tuner; only that grant's
  // resolve failures count against the tuner.
  struct Grant {
    model::StreamSession session;
    bool                 tuned = false;
  };

  // Work left for after the critical section.
  struct Effects {
    std::vector<Grant> granted;
    std::vector<Ended> ended;
  };

  // Runs fn under the mutex, promotes, then applies the effects unlocked.
  template <typename Fn>
  auto Mutate(Fn&& fn);

  queue::WaitQueue&       QueueFor(const model::QueueEntry& entry);
  const queue::WaitQueue* FindQueueOf(const std::string& ticket_id) const;

  std::optional<model::StreamSession> TryPlaceLocked(const model::QueueEntry& want, util::TimePoint now, Effects& effects);
  model::StreamSession                CreateSessionLocked(const model::QueueEntry& want, model::ResourceKind kind, uint64_t resource_id,
                                                          util::TimePoint now, Effects& effects);

  bool     EndSessionLocked(const std::string& session_id, model::EndReason reason, util::TimePoint now, Effects& effects);
  void     EvictLocked(const std::vector<std::string>& session_ids, model::EndReason reason, util::TimePoint now, Effects& effects);
  void     PenalizeTunerLocked(uint32_t tuner_id, util::TimePoint now, Effects& effects);
  void     RenewLocked(model::StreamSession& session, util::TimePoint now);

  // Live session a retried request should get back, if any.
  model::StreamSession* FindRetriedLocked(const ChannelRequest& request);
  uint32_t PromoteLocked(util::TimePoint now, Effects& effects);
  uint32_t PromoteTunersLocked(util::TimePoint now, Effects& effects);
  uint32_t PromoteCredentialsLocked(util::TimePoint now, Effects& effects);
  void     UpdateGaugesLocked() const;

  void    ApplyEffects(Effects effects);
  Effects FinalizeGrant(const Grant& grant);
  void    PersistEnd(const Ended& ended);
  void    PersistTouch(const std::string& session_id, util::TimePoint at);

  [[noreturn]] void ThrowGone(const std::string& session_id) const;

  BrokerOptions                                options_;
  std::shared_ptr<resolver::StreamUrlResolver> resolver_;
  std::shared_ptr<db::Repository>              repository_;
  util::ClockFn                                clock_;

  mutable std::mutex                             mutex_;
  registry::ResourceRegistry                     registry_;
  session::SessionTable                          sessions_;
  queue::WaitQueue                               tuner_queue_;
  std::map<std::string, queue::WaitQueue>        credential_queues_; // keyed by provider id, "" = any
  std::unordered_map<std::string, std::string>   promoted_;          // ticket -> session
  session::EvictionLog                           evictions_;
  uint64_t                                       sequence_ = 0;

  // Serializes repository access; taken before mutex_ when both are held.
  std::mutex persist_mutex_;
};

} // namespace livetv::core
