#include "app/OuiTable.hpp"
#include <cctype>
#include <fstream>

namespace netneighbor::app {

static int hexv(char c) {
  if (c>='0'&&c<='9') return c-'0';
  if (c>='a'&&c<='f') return c-'a'+10;
  if (c>='A'&&c<='F') return c-'A'+10;
  return -1;
}

std::optional<uint32_t> OuiTable::prefix_of(std::string_view mac) {
  uint32_t v = 0;
  int digits = 0;
  for (char c : mac) {
    if (c == ':' || c == '-' || c == '.') continue;
    int h = hexv(c);
    if (h < 0) return std::nullopt;
    v = (v << 4) | static_cast<uint32_t>(h);
    if (++digits == 6) return v;
  }
  return std::nullopt;
}

bool OuiTable::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;
  load(in);
  return true;
}

size_t OuiTable::load(std::istream& in) {
  size_t added = 0;
  std::string line;
  while (std::getline(in, line)) {
    auto tag = line.find("(hex)");
    if (tag == std::string::npos) continue;
    auto prefix = prefix_of(std::string_view(line).substr(0, tag));
    if (!prefix) continue;
    size_t st = tag + 5;
    while (st < line.size() && std::isspace(static_cast<unsigned char>(line[st]))) ++st;
    size_t en = line.size();
    while (en > st && std::isspace(static_cast<unsigned char>(line[en-1]))) --en;
    if (en == st) continue;
    orgs_[*prefix] = line.substr(st, en - st);
    ++added;
  }
  return added;
}

std::optional<std::string> OuiTable::lookup(std::string_view mac) const {
  auto p = prefix_of(mac);
  if (!p) return std::nullopt;
  auto it = orgs_.find(*p);
  if (it == orgs_.end()) return std::nullopt;
  return it->second;
}

} // namespace netneighbor::app
