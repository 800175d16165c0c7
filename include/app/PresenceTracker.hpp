#pragma once
#include "model/Device.hpp"
#include <chrono>
#include <vector>

namespace netneighbor::app {

// Reconcile `state` with one snapshot taken at `now`.
// New keys produce Connected; tracked keys absent from the snapshot for longer than
// `disconnect_timeout` produce Disconnected and are erased. Connected events come first.
[[nodiscard]] std::vector<netneighbor::model::PresenceEvent>
reconcile(netneighbor::model::TrackedMap& state,
          const netneighbor::model::DeviceSnapshot& snapshot,
          std::chrono::steady_clock::time_point now,
          std::chrono::steady_clock::duration disconnect_timeout);

// Owns the last-seen map across poll cycles.
class PresenceTracker {
public:
  PresenceTracker() = default;

  [[nodiscard]] std::vector<netneighbor::model::PresenceEvent>
  ingest(const netneighbor::model::DeviceSnapshot& snapshot,
         std::chrono::steady_clock::time_point now,
         std::chrono::steady_clock::duration disconnect_timeout);

  [[nodiscard]] bool is_present(const netneighbor::model::DeviceKey& key) const;
  [[nodiscard]] const netneighbor::model::TrackedEntry* find(const netneighbor::model::DeviceKey& key) const;
  [[nodiscard]] const netneighbor::model::TrackedMap& entries() const { return tracked_; }
  [[nodiscard]] size_t size() const { return tracked_.size(); }
  [[nodiscard]] bool empty() const { return tracked_.empty(); }
  void clear() { tracked_.clear(); }

private:
  netneighbor::model::TrackedMap tracked_;
};

} // namespace netneighbor::app
