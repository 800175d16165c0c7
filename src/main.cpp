#include "app/Config.hpp"
#include "app/EventLog.hpp"
#include "app/EventSink.hpp"
#include "app/OuiTable.hpp"
#include "app/PresenceTracker.hpp"
#include "collectors/CommandNeighborReader.hpp"
#include "collectors/NeighborCollector.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#ifndef NETNEIGHBOR_VERSION
#define NETNEIGHBOR_VERSION "0.0.0"
#endif

using namespace std::chrono_literals;

// Sleep until `deadline` in short slices so SIGINT is honoured promptly.
static void sleep_until_or_stop(std::chrono::steady_clock::time_point deadline) {
  while (!netneighbor::ui::g_stop.load()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, 100ms));
  }
}

int main(int argc, char** argv) {
  netneighbor::app::CliArgs cli;
  std::string err;
  if (!netneighbor::app::parse_cli(argc, argv, cli, err)) {
    std::fprintf(stderr, "netneighbor: %s\n", err.c_str());
    std::cerr << netneighbor::app::usage_text();
    return 2;
  }
  if (cli.help) {
    std::cout << netneighbor::app::usage_text();
    return 0;
  }
  if (cli.version) {
    std::cout << "netneighbor " << NETNEIGHBOR_VERSION << "\n";
    return 0;
  }

  auto cfg = netneighbor::app::load_config(cli.config_path ? *cli.config_path
                                                           : netneighbor::app::config_file_path());
  netneighbor::app::apply_cli(cli, cfg);

  netneighbor::app::OuiTable vendors;
  if (!cfg.oui_file.empty() && !vendors.load(cfg.oui_file)) {
    std::fprintf(stderr, "netneighbor: vendor table %s unreadable; vendors will show as Unknown\n",
                 cfg.oui_file.c_str());
  }

  std::unique_ptr<netneighbor::app::EventLog> event_log;
  if (!cfg.log_dir.empty()) event_log = std::make_unique<netneighbor::app::EventLog>(cfg.log_dir);

  netneighbor::collectors::NeighborCollector collector(
      std::make_unique<netneighbor::collectors::CommandNeighborReader>(cfg.arp_cmd, cfg.neigh_cmd),
      cfg.interface);
  netneighbor::app::PresenceTracker tracker;
  netneighbor::app::EventSink sink(std::cout, vendors.empty() ? nullptr : &vendors,
                                   cfg.color && netneighbor::ui::tty_stdout());

  netneighbor::ui::install_stop_handlers();

  {
    std::ostringstream os;
    os << "NetNeighbor - Network Connection Monitor\n"
       << "Monitoring every " << cfg.interval_s << " seconds\n"
       << "Disconnection timeout: " << cfg.disconnect_timeout_s << " seconds\n";
    if (cfg.interface) os << "Interface: " << *cfg.interface << "\n";
    else os << "Monitoring all interfaces\n";
    os << "Press Ctrl+C to stop\n\n";
    sink.banner(os.str());
  }

  netneighbor::model::DeviceSnapshot snapshot;
  for (int i = 0; (cfg.iterations <= 0 || i < cfg.iterations) && !netneighbor::ui::g_stop.load(); ++i) {
    if (collector.sample(snapshot)) {
      auto events = tracker.ingest(snapshot, std::chrono::steady_clock::now(), cfg.disconnect_timeout());
      for (const auto& ev : events) {
        sink.emit(ev);
        // failures are reported on stderr by EventLog and retried on the next event
        if (event_log) (void)event_log->append(ev);
      }
      if (cfg.verbose && tracker.empty()) sink.emit_idle();
    } else {
      std::fprintf(stderr, "netneighbor: Error reading network state: %s\n", collector.last_error().c_str());
    }
    if (cfg.iterations > 0 && i + 1 >= cfg.iterations) break;
    sleep_until_or_stop(std::chrono::steady_clock::now() + cfg.interval());
  }
  return 0;
}
