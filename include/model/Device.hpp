#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace netneighbor::model {

// One observed neighbor. Addresses are kept exactly as the source tool printed them.
struct Device {
  std::string ip_address;
  std::string mac_address;
  std::string interface;

  bool operator==(const Device&) const = default;
};

// Identity of a device: (ip, mac). Interface is not part of it.
struct DeviceKey {
  std::string ip_address;
  std::string mac_address;

  bool operator==(const DeviceKey&) const = default;
};

inline DeviceKey key_of(const Device& d) { return DeviceKey{d.ip_address, d.mac_address}; }

struct DeviceKeyHash {
  size_t operator()(const DeviceKey& k) const noexcept {
    size_t h = std::hash<std::string>{}(k.ip_address);
    // hash_combine
    h ^= std::hash<std::string>{}(k.mac_address) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
  }
};

// Devices seen in one poll cycle; duplicate keys collapse, later insert wins.
using DeviceSnapshot = std::unordered_map<DeviceKey, Device, DeviceKeyHash>;

inline void upsert(DeviceSnapshot& snap, Device d) {
  auto k = key_of(d);
  snap.insert_or_assign(std::move(k), std::move(d));
}

struct TrackedEntry {
  Device device;
  std::chrono::steady_clock::time_point last_seen{};
};

using TrackedMap = std::unordered_map<DeviceKey, TrackedEntry, DeviceKeyHash>;

enum class PresenceKind { Connected, Disconnected };

struct PresenceEvent {
  PresenceKind kind{PresenceKind::Connected};
  Device device;
};

[[nodiscard]] inline const char* kind_name(PresenceKind k) {
  return k == PresenceKind::Connected ? "CONNECTED" : "DISCONNECTED";
}

} // namespace netneighbor::model
