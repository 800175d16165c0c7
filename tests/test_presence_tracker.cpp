#include "minitest.hpp"
#include "app/PresenceTracker.hpp"
#include <chrono>

using namespace std::chrono_literals;
using netneighbor::app::PresenceTracker;
using netneighbor::model::Device;
using netneighbor::model::DeviceSnapshot;
using netneighbor::model::PresenceKind;
using netneighbor::model::key_of;

static const std::chrono::steady_clock::time_point T0{};

static DeviceSnapshot snap_of(std::initializer_list<Device> devs) {
  DeviceSnapshot s;
  for (const auto& d : devs) netneighbor::model::upsert(s, d);
  return s;
}

static const Device A{"192.168.1.5", "aa:bb:cc:dd:ee:ff", "wlan0"};
static const Device B{"192.168.1.6", "11:22:33:44:55:66", "eth0"};

TEST(tracker_first_sighting_connects) {
  PresenceTracker t;
  auto ev = t.ingest(snap_of({A}), T0, 10s);
  ASSERT_EQ(ev.size(), 1u);
  ASSERT_TRUE(ev[0].kind == PresenceKind::Connected);
  ASSERT_EQ(ev[0].device, A);
  ASSERT_TRUE(t.is_present(key_of(A)));
}

TEST(tracker_end_to_end_timeout) {
  PresenceTracker t;
  auto e1 = t.ingest(snap_of({A}), T0, 10s);
  ASSERT_EQ(e1.size(), 1u);
  auto e2 = t.ingest({}, T0 + 5s, 10s);
  ASSERT_TRUE(e2.empty());
  ASSERT_TRUE(t.is_present(key_of(A)));
  auto e3 = t.ingest({}, T0 + 11s, 10s);
  ASSERT_EQ(e3.size(), 1u);
  ASSERT_TRUE(e3[0].kind == PresenceKind::Disconnected);
  ASSERT_EQ(e3[0].device, A);
  ASSERT_TRUE(t.empty());
}

TEST(tracker_boundary_is_still_present) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 10s);
  ASSERT_TRUE(t.ingest({}, T0 + 10s, 10s).empty());
  ASSERT_TRUE(t.is_present(key_of(A)));
  ASSERT_EQ(t.ingest({}, T0 + 10s + 1ms, 10s).size(), 1u);
}

TEST(tracker_repeated_snapshot_is_quiet) {
  PresenceTracker t;
  auto s = snap_of({A, B});
  ASSERT_EQ(t.ingest(s, T0, 10s).size(), 2u);
  for (int i = 1; i <= 20; ++i) {
    ASSERT_TRUE(t.ingest(s, T0 + std::chrono::seconds(i * 30), 10s).empty());
  }
  ASSERT_EQ(t.size(), 2u);
}

TEST(tracker_transient_miss_tolerated) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 10s);
  ASSERT_TRUE(t.ingest({}, T0 + 2s, 10s).empty());
  ASSERT_TRUE(t.ingest({}, T0 + 4s, 10s).empty());
  ASSERT_TRUE(t.ingest(snap_of({A}), T0 + 6s, 10s).empty());
  // last_seen refreshed at 6s
  ASSERT_TRUE(t.ingest({}, T0 + 15s, 10s).empty());
  ASSERT_EQ(t.ingest({}, T0 + 17s, 10s).size(), 1u);
}

TEST(tracker_reconnect_after_disconnect) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 10s);
  ASSERT_EQ(t.ingest({}, T0 + 20s, 10s).size(), 1u);
  auto ev = t.ingest(snap_of({A}), T0 + 22s, 10s);
  ASSERT_EQ(ev.size(), 1u);
  ASSERT_TRUE(ev[0].kind == PresenceKind::Connected);
}

TEST(tracker_interface_change_updates_not_reconnects) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 10s);
  Device moved = A; moved.interface = "eth1";
  ASSERT_TRUE(t.ingest(snap_of({moved}), T0 + 1s, 10s).empty());
  const auto* e = t.find(key_of(A));
  ASSERT_TRUE(e != nullptr);
  ASSERT_EQ(e->device.interface, "eth1");
  ASSERT_TRUE(e->last_seen == T0 + 1s);
}

TEST(tracker_disconnect_reports_stored_device) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 5s);
  Device moved = A; moved.interface = "eth9";
  (void)t.ingest(snap_of({moved}), T0 + 1s, 5s);
  auto ev = t.ingest({}, T0 + 7s, 5s);
  ASSERT_EQ(ev.size(), 1u);
  ASSERT_EQ(ev[0].device.interface, "eth9");
}

TEST(tracker_connected_before_disconnected) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 3s);
  auto ev = t.ingest(snap_of({B}), T0 + 4s, 3s);
  ASSERT_EQ(ev.size(), 2u);
  ASSERT_TRUE(ev[0].kind == PresenceKind::Connected);
  ASSERT_EQ(ev[0].device, B);
  ASSERT_TRUE(ev[1].kind == PresenceKind::Disconnected);
  ASSERT_EQ(ev[1].device, A);
}

TEST(tracker_same_ip_new_mac_is_new_device) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 10s);
  Device spoof = A; spoof.mac_address = "de:ad:be:ef:00:01";
  auto ev = t.ingest(snap_of({spoof}), T0 + 1s, 10s);
  ASSERT_EQ(ev.size(), 1u);
  ASSERT_TRUE(ev[0].kind == PresenceKind::Connected);
  ASSERT_EQ(t.size(), 2u);
}

TEST(tracker_zero_timeout_flaps) {
  PresenceTracker t;
  (void)t.ingest(snap_of({A}), T0, 0s);
  ASSERT_EQ(t.ingest({}, T0 + 1s, 0s).size(), 1u);
  ASSERT_EQ(t.ingest(snap_of({A}), T0 + 2s, 0s).size(), 1u);
}

TEST(reconcile_on_external_state) {
  netneighbor::model::TrackedMap state;
  auto ev = netneighbor::app::reconcile(state, snap_of({A, B}), T0, 10s);
  ASSERT_EQ(ev.size(), 2u);
  ASSERT_EQ(state.size(), 2u);
  ev = netneighbor::app::reconcile(state, snap_of({B}), T0 + 11s, 10s);
  ASSERT_EQ(ev.size(), 1u);
  ASSERT_TRUE(!state.contains(key_of(A)));
}

TEST(device_key_no_concatenation_collision) {
  netneighbor::model::DeviceKey k1{"1.2.3.4", "5"};
  netneighbor::model::DeviceKey k2{"1.2.3.45", ""};
  ASSERT_NE(k1, k2);
  DeviceSnapshot s;
  netneighbor::model::upsert(s, {"1.2.3.4", "5", "eth0"});
  netneighbor::model::upsert(s, {"1.2.3.45", "", "eth0"});
  ASSERT_EQ(s.size(), 2u);
}
