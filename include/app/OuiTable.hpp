#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace netneighbor::app {

// MAC prefix -> organization, loaded from an IEEE oui.txt
// ("AA-BB-CC   (hex)\t\tOrganization" lines; everything else is ignored).
class OuiTable {
public:
  // Returns false if the file cannot be opened. A table that fails to load stays empty.
  bool load(const std::string& path);
  // Returns the number of prefixes read.
  size_t load(std::istream& in);

  [[nodiscard]] std::optional<std::string> lookup(std::string_view mac) const;
  [[nodiscard]] size_t size() const { return orgs_.size(); }
  [[nodiscard]] bool empty() const { return orgs_.empty(); }

  // First three octets as a 24-bit value; accepts ':', '-', '.' separators and either case.
  [[nodiscard]] static std::optional<uint32_t> prefix_of(std::string_view mac);

private:
  std::unordered_map<uint32_t, std::string> orgs_;
};

} // namespace netneighbor::app
