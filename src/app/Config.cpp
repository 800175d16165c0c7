#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace netneighbor::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("NETNEIGHBOR_", 0) == 0) {
    alt = std::string("netneighbor_") + n.substr(12);
  } else if (n.rfind("netneighbor_", 0) == 0) {
    alt = std::string("NETNEIGHBOR_") + n.substr(12);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/netneighbor/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/netneighbor/config.toml";
  return {};
}

std::string default_oui_file() {
  static constexpr const char* candidates[] = {
    "/usr/share/hwdata/oui.txt",
    "/usr/share/ieee-data/oui.txt",
    "/usr/share/misc/oui.txt",
    "/var/lib/ieee-data/oui.txt",
  };
  for (const char* c : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(c, ec)) return c;
  }
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const netneighbor::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const netneighbor::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const netneighbor::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static void clamp_values(MonitorConfig& c) {
  if (c.interval_s < 1) c.interval_s = 1;
  if (c.disconnect_timeout_s < 0) c.disconnect_timeout_s = 0;
  if (c.interface && c.interface->empty()) c.interface.reset();
}

MonitorConfig load_config(const std::string& toml_path) {
  MonitorConfig c{};
  netneighbor::util::TomlReader toml;
  bool have_toml = !toml_path.empty() && toml.load(toml_path);

  // --- [monitor] ---
  c.interval_s           = resolve_int(toml, have_toml, "monitor", "interval", "NETNEIGHBOR_INTERVAL", c.interval_s);
  c.disconnect_timeout_s = resolve_int(toml, have_toml, "monitor", "disconnect_timeout", "NETNEIGHBOR_DISCONNECT_TIMEOUT", c.disconnect_timeout_s);
  c.verbose              = resolve_bool(toml, have_toml, "monitor", "verbose", "NETNEIGHBOR_VERBOSE", c.verbose);
  std::string iface      = resolve_string(toml, have_toml, "monitor", "interface", "NETNEIGHBOR_INTERFACE", "");
  if (!iface.empty()) c.interface = iface;
  if (resolve_bool(toml, have_toml, "monitor", "all_interfaces", "NETNEIGHBOR_ALL_INTERFACES", false))
    c.interface.reset();

  // --- [commands] ---
  c.arp_cmd   = resolve_string(toml, have_toml, "commands", "arp",   "NETNEIGHBOR_ARP_CMD",   c.arp_cmd);
  c.neigh_cmd = resolve_string(toml, have_toml, "commands", "neigh", "NETNEIGHBOR_NEIGH_CMD", c.neigh_cmd);

  // --- [vendor] ---
  c.oui_file = resolve_string(toml, have_toml, "vendor", "oui_file", "NETNEIGHBOR_OUI_FILE", "");
  if (c.oui_file.empty()) c.oui_file = default_oui_file();

  // --- [ui] ---
  c.color = resolve_bool(toml, have_toml, "ui", "color", "NETNEIGHBOR_COLOR", c.color);

  // --- [log] ---
  c.log_dir = resolve_string(toml, have_toml, "log", "dir", "NETNEIGHBOR_LOG_DIR", "");

  clamp_values(c);
  return c;
}

static bool parse_int_arg(const std::string& flag, const char* v, int& out, std::string& err) {
  try {
    size_t used = 0;
    out = std::stoi(v, &used);
    if (used != std::char_traits<char>::length(v)) throw std::invalid_argument(v);
    return true;
  } catch (const std::exception&) {
    err = "invalid value for " + flag + ": '" + v + "'";
    return false;
  }
}

bool parse_cli(int argc, const char* const* argv, CliArgs& out, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::string val;
    bool inline_val = false;
    // --flag=value form
    if (a.rfind("--", 0) == 0) {
      auto eq = a.find('=');
      if (eq != std::string::npos) { val = a.substr(eq + 1); a = a.substr(0, eq); inline_val = true; }
    }
    auto next = [&](const char*& v) -> bool {
      if (inline_val) { v = val.c_str(); return true; }
      if (i + 1 >= argc) { err = "missing value for " + a; return false; }
      v = argv[++i];
      return true;
    };
    const char* v = nullptr;
    int n = 0;
    if (a == "-i" || a == "--interval") {
      if (!next(v) || !parse_int_arg(a, v, n, err)) return false;
      out.interval_s = n;
    } else if (a == "-n" || a == "--interface") {
      if (!next(v)) return false;
      out.interface = std::string(v);
    } else if (a == "-v" || a == "--verbose") {
      out.verbose = true;
    } else if (a == "--all-interfaces") {
      out.all_interfaces = true;
    } else if (a == "--disconnect-timeout") {
      if (!next(v) || !parse_int_arg(a, v, n, err)) return false;
      out.disconnect_timeout_s = n;
    } else if (a == "--oui-file") {
      if (!next(v)) return false;
      out.oui_file = std::string(v);
    } else if (a == "--log-dir") {
      if (!next(v)) return false;
      out.log_dir = std::string(v);
    } else if (a == "--config") {
      if (!next(v)) return false;
      out.config_path = std::string(v);
    } else if (a == "--no-color") {
      out.no_color = true;
    } else if (a == "--iterations") {
      if (!next(v) || !parse_int_arg(a, v, n, err)) return false;
      out.iterations = n;
    } else if (a == "-h" || a == "--help") {
      out.help = true;
    } else if (a == "-V" || a == "--version") {
      out.version = true;
    } else {
      err = "unknown argument: " + a;
      return false;
    }
  }
  return true;
}

void apply_cli(const CliArgs& cli, MonitorConfig& cfg) {
  if (cli.interval_s) cfg.interval_s = *cli.interval_s;
  if (cli.disconnect_timeout_s) cfg.disconnect_timeout_s = *cli.disconnect_timeout_s;
  if (cli.interface) cfg.interface = *cli.interface;
  if (cli.all_interfaces) cfg.interface.reset();
  if (cli.verbose) cfg.verbose = true;
  if (cli.oui_file) cfg.oui_file = *cli.oui_file;
  if (cli.log_dir) cfg.log_dir = *cli.log_dir;
  if (cli.no_color) cfg.color = false;
  if (cli.iterations) cfg.iterations = *cli.iterations;
  clamp_values(cfg);
}

std::string usage_text() {
  return
    "Usage: netneighbor [options]\n"
    "  -i, --interval N            refresh interval in seconds (default 2)\n"
    "  -n, --interface IF          only report devices on IF (e.g. wlan0, eth0)\n"
    "      --all-interfaces        monitor every interface (overrides -n)\n"
    "  -v, --verbose               report when no devices are tracked\n"
    "      --disconnect-timeout N  seconds unseen before DISCONNECTED (default 10)\n"
    "      --oui-file PATH         IEEE OUI table for vendor names\n"
    "      --log-dir DIR           append events to hourly files in DIR\n"
    "      --config PATH           config file (default ~/.config/netneighbor/config.toml)\n"
    "      --no-color              plain output\n"
    "      --iterations N          stop after N poll cycles\n"
    "  -V, --version               print version\n"
    "  -h, --help                  this help\n"
    "Runs until Ctrl+C.\n";
}

} // namespace netneighbor::app
