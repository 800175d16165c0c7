#include "app/PresenceTracker.hpp"

using netneighbor::model::PresenceEvent;
using netneighbor::model::PresenceKind;

namespace netneighbor::app {

std::vector<PresenceEvent> reconcile(netneighbor::model::TrackedMap& state,
                                     const netneighbor::model::DeviceSnapshot& snapshot,
                                     std::chrono::steady_clock::time_point now,
                                     std::chrono::steady_clock::duration disconnect_timeout) {
  std::vector<PresenceEvent> out;
  // snapshot is keyed already, so it doubles as the "seen this cycle" set
  for (const auto& [key, dev] : snapshot) {
    auto it = state.find(key);
    if (it == state.end()) {
      out.push_back({PresenceKind::Connected, dev});
      state.emplace(key, netneighbor::model::TrackedEntry{dev, now});
    } else {
      it->second.device = dev;
      it->second.last_seen = now;
    }
  }
  // strict '>': a device exactly at the timeout is still present
  for (auto it = state.begin(); it != state.end(); ) {
    if (!snapshot.contains(it->first) && (now - it->second.last_seen) > disconnect_timeout) {
      out.push_back({PresenceKind::Disconnected, std::move(it->second.device)});
      it = state.erase(it);
    } else {
      ++it;
    }
  }
  return out;
}

std::vector<PresenceEvent> PresenceTracker::ingest(const netneighbor::model::DeviceSnapshot& snapshot,
                                                   std::chrono::steady_clock::time_point now,
                                                   std::chrono::steady_clock::duration disconnect_timeout) {
  return reconcile(tracked_, snapshot, now, disconnect_timeout);
}

bool PresenceTracker::is_present(const netneighbor::model::DeviceKey& key) const {
  return tracked_.contains(key);
}

const netneighbor::model::TrackedEntry* PresenceTracker::find(const netneighbor::model::DeviceKey& key) const {
  auto it = tracked_.find(key);
  return it == tracked_.end() ? nullptr : &it->second;
}

} // namespace netneighbor::app
