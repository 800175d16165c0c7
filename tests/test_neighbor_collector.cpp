#include "minitest.hpp"
#include "collectors/CommandNeighborReader.hpp"
#include "collectors/NeighborCollector.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using netneighbor::collectors::CommandNeighborReader;
using netneighbor::collectors::INeighborReader;
using netneighbor::collectors::NeighborCollector;
using netneighbor::collectors::NeighborText;
using netneighbor::model::DeviceKey;
using netneighbor::model::DeviceSnapshot;

namespace {

class FixtureReader : public INeighborReader {
public:
  std::optional<NeighborText> text;
  std::string err{"fixture: spawn failed"};
  int reads{0};

  std::optional<NeighborText> read() override { ++reads; return text; }
  const std::string& last_error() const override { return err; }
  const char* name() const override { return "fixture"; }
};

} // namespace

static fs::path make_root_neigh() {
  auto root = fs::temp_directory_path() / fs::path("netneighbor_test_collector_") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root);
  std::ofstream(root / "arp.txt") <<
    "? (192.168.1.5) at aa:bb:cc:dd:ee:ff [ether] on wlan0\n"
    "? (192.168.1.1) at 00:11:22:33:44:55 [ether] on eth0\n";
  std::ofstream(root / "neigh.txt") <<
    "192.168.1.6 dev eth0 lladdr 11:22:33:44:55:66 REACHABLE\n"
    "192.168.1.5 dev wlan1 lladdr aa:bb:cc:dd:ee:ff STALE\n";
  return root;
}

TEST(collect_unions_both_tables) {
  FixtureReader r;
  r.text = NeighborText{
    "? (192.168.1.5) at aa:bb:cc:dd:ee:ff [ether] on wlan0\n",
    "192.168.1.6 dev eth0 lladdr 11:22:33:44:55:66 REACHABLE\n"
    "192.168.1.5 dev wlan1 lladdr aa:bb:cc:dd:ee:ff STALE\n"};
  DeviceSnapshot out; std::string err;
  ASSERT_TRUE(netneighbor::collectors::collect_snapshot(r, std::nullopt, out, err));
  ASSERT_EQ(out.size(), 2u);
  // the neighbor table is merged second and wins
  ASSERT_EQ(out.at(DeviceKey{"192.168.1.5", "aa:bb:cc:dd:ee:ff"}).interface, "wlan1");
}

TEST(collect_reader_failure_is_error) {
  FixtureReader r;
  DeviceSnapshot out;
  netneighbor::model::upsert(out, {"10.0.0.1", "02:00:00:00:00:01", "eth0"});
  std::string err;
  ASSERT_TRUE(!netneighbor::collectors::collect_snapshot(r, std::nullopt, out, err));
  ASSERT_EQ(err, "fixture: spawn failed");
  ASSERT_TRUE(out.empty());
}

TEST(collect_empty_text_is_empty_snapshot) {
  FixtureReader r;
  r.text = NeighborText{};
  DeviceSnapshot out; std::string err;
  ASSERT_TRUE(netneighbor::collectors::collect_snapshot(r, std::nullopt, out, err));
  ASSERT_TRUE(out.empty());
}

TEST(collector_applies_interface_filter) {
  auto reader = std::make_unique<FixtureReader>();
  reader->text = NeighborText{
    "? (192.168.1.5) at aa:bb:cc:dd:ee:ff [ether] on wlan0\n",
    "192.168.1.6 dev eth0 lladdr 11:22:33:44:55:66 REACHABLE\n"};
  NeighborCollector c(std::move(reader), std::string("wlan0"));
  DeviceSnapshot out;
  ASSERT_TRUE(c.sample(out));
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out.begin()->second.interface, "wlan0");
  ASSERT_TRUE(c.last_error().empty());
}

TEST(command_reader_split_output) {
  auto t = CommandNeighborReader::split_output("arp-part\n===SPLIT===\nneigh-part\n");
  ASSERT_EQ(t.arp, "arp-part\n");
  ASSERT_EQ(t.neigh, "\nneigh-part\n");
  auto none = CommandNeighborReader::split_output("no marker here");
  ASSERT_TRUE(none.arp.empty() && none.neigh.empty());
}

TEST(command_reader_script_shape) {
  CommandNeighborReader r("arp -a -n", "ip neigh show");
  ASSERT_EQ(r.script(), "arp -a -n; echo '===SPLIT==='; ip neigh show");
}

TEST(command_reader_runs_commands) {
  auto root = make_root_neigh();
  auto reader = std::make_unique<CommandNeighborReader>("cat '" + (root / "arp.txt").string() + "'",
                                                        "cat '" + (root / "neigh.txt").string() + "'");
  NeighborCollector c(std::move(reader), std::nullopt);
  DeviceSnapshot out;
  ASSERT_TRUE(c.sample(out));
  ASSERT_EQ(out.size(), 3u);
  ASSERT_TRUE(out.contains(DeviceKey{"192.168.1.1", "00:11:22:33:44:55"}));
  fs::remove_all(root);
}

TEST(command_reader_nonzero_exit_is_empty) {
  auto root = make_root_neigh();
  CommandNeighborReader r("cat '" + (root / "arp.txt").string() + "'", "false");
  auto t = r.read();
  ASSERT_TRUE(t.has_value());
  ASSERT_TRUE(t->arp.empty() && t->neigh.empty());
  fs::remove_all(root);
}
