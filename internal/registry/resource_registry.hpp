#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/credential_slot.hpp"
#include "internal/model/tuner.hpp"
#include "internal/util/time.hpp"

namespace livetv::registry {

/*
  In-memory table of tuners and credential slots.

  Not internally synchronized: the broker owns the only instance and
  calls it under its own mutex.
*/
class ResourceRegistry {
 public:
  ResourceRegistry(uint32_t tuner_count, const std::vector<model::CredentialSlot>& credentials);

  // ---------------------------------------------------------------------
  // Tuners
  // ---------------------------------------------------------------------

  bool HasTuners() const {
    return !tuners_.empty();
  }

  model::Tuner* FindTuner(uint32_t id);

  // Busy tuner already tuned to the channel.
  model::Tuner* FindSharableTuner(const std::string& channel_key);

  // Lowest-id available tuner.
  model::Tuner* FindAvailableTuner();

  void Tune(model::Tuner& tuner, const std::string& channel_key, util::TimePoint now);
  void Attach(model::Tuner& tuner, const std::string& session_id, util::TimePoint now);

  // Returns true when the tuner went back to available.
  bool Detach(model::Tuner& tuner, const std::string& session_id, util::TimePoint now);

  // Both return the ids of the sessions that were riding the tuner.
  std::vector<std::string> MarkFailed(model::Tuner& tuner, util::TimePoint now);
  std::vector<std::string> EnterMaintenance(model::Tuner& tuner, util::TimePoint now);

  void Recover(model::Tuner& tuner, util::TimePoint now);

  const std::vector<model::Tuner>& Tuners() const {
    return tuners_;
  }

  std::vector<model::Tuner*> FailedTuners();

  uint32_t BusyTuners() const;

  std::map<std::string, uint32_t> ChannelMapping() const;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  // Empty provider_id means any provider.
  bool HasCredentials(const std::string& provider_id) const;

  model::CredentialSlot* FindCredential(uint64_t id);

  // Slot with the most spare capacity; ties go to the lowest id.
  model::CredentialSlot* PickCredential(const std::string& provider_id);

  void AcquireSlot(model::CredentialSlot& slot);
  void ReleaseSlot(model::CredentialSlot& slot);

  std::vector<model::CredentialSlot> Credentials() const;

 private:
  void Transition(model::Tuner& tuner, model::TunerStatus to);
  std::vector<std::string> Evacuate(model::Tuner& tuner);

  std::vector<model::Tuner>                   tuners_; // index = id - 1
  std::unordered_map<std::string, uint32_t>   channel_to_tuner_;
  std::map<uint64_t, model::CredentialSlot>   credentials_;
};

} // namespace livetv::registry
