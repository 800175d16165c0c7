#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace netneighbor::app {

struct MonitorConfig {
  int interval_s{2};
  std::optional<std::string> interface;
  bool verbose{false};
  int disconnect_timeout_s{10};
  std::string arp_cmd{"arp -a -n"};
  std::string neigh_cmd{"ip neigh show"};
  std::string oui_file;     // empty: no vendor lookup
  bool color{true};
  std::string log_dir;      // empty: event log disabled
  int iterations{0};        // <=0 runs until interrupted

  [[nodiscard]] std::chrono::seconds interval() const { return std::chrono::seconds(interval_s); }
  [[nodiscard]] std::chrono::seconds disconnect_timeout() const { return std::chrono::seconds(disconnect_timeout_s); }
};

// Command line as given; unset fields leave file/env/default values alone.
struct CliArgs {
  std::optional<int> interval_s;
  std::optional<std::string> interface;
  bool all_interfaces{false};
  bool verbose{false};
  std::optional<int> disconnect_timeout_s;
  std::optional<std::string> oui_file;
  std::optional<std::string> log_dir;
  std::optional<std::string> config_path;
  bool no_color{false};
  std::optional<int> iterations;
  bool help{false};
  bool version{false};
};

// Environment helpers; NETNEIGHBOR_FOO and netneighbor_FOO are both accepted.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/netneighbor/config.toml, else ~/.config/netneighbor/config.toml
std::string config_file_path();

// First existing IEEE OUI table among the usual distro locations, or empty.
std::string default_oui_file();

// Resolve TOML -> env -> compiled default. An unreadable file is treated as absent.
[[nodiscard]] MonitorConfig load_config(const std::string& toml_path);

// Parse argv. Returns false and sets err on unknown flags or bad numbers.
[[nodiscard]] bool parse_cli(int argc, const char* const* argv, CliArgs& out, std::string& err);

// CLI wins over everything else; values are clamped here.
void apply_cli(const CliArgs& cli, MonitorConfig& cfg);

[[nodiscard]] std::string usage_text();

} // namespace netneighbor::app
