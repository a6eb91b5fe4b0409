#include "resource_registry.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace livetv::registry {

using model::TunerStatus;

ResourceRegistry::ResourceRegistry(uint32_t tuner_count, const std::vector<model::CredentialSlot>& credentials) {
  tuners_.reserve(tuner_count);
  for (uint32_t i = 1; i <= tuner_count; ++i) {
    model::Tuner tuner;
    tuner.id = i;
    tuners_.push_back(std::move(tuner));
  }

  for (const auto& slot : credentials) {
    if (credentials_.contains(slot.id)) {
      throw util::InvalidArgument("duplicate credential id " + std::to_string(slot.id));
    }
    auto copy               = slot;
    copy.active_connections = 0;
    credentials_.emplace(copy.id, std::move(copy));
  }
}

// ------------------------------------------------------------------
// Tuners
// ------------------------------------------------------------------

model::Tuner* ResourceRegistry::FindTuner(uint32_t id) {
  if (id == 0 || id > tuners_.size()) return nullptr;
  return &tuners_[id - 1];
}

model::Tuner* ResourceRegistry::FindSharableTuner(const std::string& channel_key) {
  auto it = channel_to_tuner_.find(channel_key);
  if (it == channel_to_tuner_.end()) return nullptr;

  auto* tuner = FindTuner(it->second);
  if (!tuner || tuner->status != TunerStatus::kBusy) return nullptr;
  return tuner;
}

model::Tuner* ResourceRegistry::FindAvailableTuner() {
  for (auto& tuner : tuners_) {
    if (tuner.status == TunerStatus::kAvailable) return &tuner;
  }
  return nullptr;
}

void ResourceRegistry::Transition(model::Tuner& tuner, TunerStatus to) {
  if (!model::CanTransition(tuner.status, to)) {
    throw util::InvalidState("tuner " + std::to_string(tuner.id) + ": cannot move from " + std::string(model::ToString(tuner.status)) + " to " +
                             std::string(model::ToString(to)));
  }
  tuner.status = to;
}

void ResourceRegistry::Tune(model::Tuner& tuner, const std::string& channel_key, util::TimePoint now) {
  if (tuner.status != TunerStatus::kAvailable) {
    throw util::InvalidState("tuner " + std::to_string(tuner.id) + " is not available");
  }
  Transition(tuner, TunerStatus::kBusy);
  tuner.tuned_channel = channel_key;
  tuner.last_activity = now;
  channel_to_tuner_[channel_key] = tuner.id;
}

void ResourceRegistry::Attach(model::Tuner& tuner, const std::string& session_id, util::TimePoint now) {
  if (tuner.status != TunerStatus::kBusy) {
    throw util::InvalidState("tuner " + std::to_string(tuner.id) + " is not tuned");
  }
  tuner.session_ids.insert(session_id);
  tuner.last_activity = now;
}

bool ResourceRegistry::Detach(model::Tuner& tuner, const std::string& session_id, util::TimePoint now) {
  if (tuner.session_ids.erase(session_id) == 0) return false;
  tuner.last_activity = now;

  if (!tuner.session_ids.empty() || tuner.status != TunerStatus::kBusy) return false;

  channel_to_tuner_.erase(tuner.tuned_channel);
  tuner.tuned_channel.clear();
  Transition(tuner, TunerStatus::kAvailable);
  return true;
}

std::vector<std::string> ResourceRegistry::Evacuate(model::Tuner& tuner) {
  std::vector<std::string> riders(tuner.session_ids.begin(), tuner.session_ids.end());
  tuner.session_ids.clear();
  if (!tuner.tuned_channel.empty()) {
    channel_to_tuner_.erase(tuner.tuned_channel);
    tuner.tuned_channel.clear();
  }
  return riders;
}

std::vector<std::string> ResourceRegistry::MarkFailed(model::Tuner& tuner, util::TimePoint now) {
  Transition(tuner, TunerStatus::kFailed);
  tuner.failure_count++;
  tuner.failed_at     = now;
  tuner.last_activity = now;
  return Evacuate(tuner);
}

std::vector<std::string> ResourceRegistry::EnterMaintenance(model::Tuner& tuner, util::TimePoint now) {
  Transition(tuner, TunerStatus::kMaintenance);
  tuner.last_activity = now;
  return Evacuate(tuner);
}

void ResourceRegistry::Recover(model::Tuner& tuner, util::TimePoint now) {
  if (!model::IsOutOfService(tuner.status)) return;
  Transition(tuner, TunerStatus::kAvailable);
  tuner.failure_count = 0;
  tuner.last_activity = now;
}

std::vector<model::Tuner*> ResourceRegistry::FailedTuners() {
  std::vector<model::Tuner*> out;
  for (auto& tuner : tuners_) {
    if (tuner.status == TunerStatus::kFailed) out.push_back(&tuner);
  }
  return out;
}

uint32_t ResourceRegistry::BusyTuners() const {
  uint32_t busy = 0;
  for (const auto& tuner : tuners_) {
    if (tuner.status == TunerStatus::kBusy) ++busy;
  }
  return busy;
}

std::map<std::string, uint32_t> ResourceRegistry::ChannelMapping() const {
  return {channel_to_tuner_.begin(), channel_to_tuner_.end()};
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

bool ResourceRegistry::HasCredentials(const std::string& provider_id) const {
  if (provider_id.empty()) return !credentials_.empty();
  for (const auto& [_, slot] : credentials_) {
    if (slot.provider_id == provider_id) return true;
  }
  return false;
}

model::CredentialSlot* ResourceRegistry::FindCredential(uint64_t id) {
  auto it = credentials_.find(id);
  return it == credentials_.end() ? nullptr : &it->second;
}

model::CredentialSlot* ResourceRegistry::PickCredential(const std::string& provider_id) {
  model::CredentialSlot* best = nullptr;
  for (auto& [_, slot] : credentials_) {
    if (!provider_id.empty() && slot.provider_id != provider_id) continue;
    if (slot.Spare() == 0) continue;
    // map iteration is ascending id, so strict > keeps the lowest id on ties
    if (!best || slot.Spare() > best->Spare()) best = &slot;
  }
  return best;
}

void ResourceRegistry::AcquireSlot(model::CredentialSlot& slot) {
  if (slot.Spare() == 0) {
    throw util::InvalidState("credential " + std::to_string(slot.id) + " has no spare connections");
  }
  slot.active_connections++;
}

void ResourceRegistry::ReleaseSlot(model::CredentialSlot& slot) {
  if (slot.active_connections > 0) slot.active_connections--;
}

std::vector<model::CredentialSlot> ResourceRegistry::Credentials() const {
  std::vector<model::CredentialSlot> out;
  out.reserve(credentials_.size());
  for (const auto& [_, slot] : credentials_) {
    out.push_back(slot);
  }
  return out;
}

} // namespace livetv::registry
