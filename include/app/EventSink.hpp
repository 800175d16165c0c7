#pragma once
#include "app/OuiTable.hpp"
#include "model/Device.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace netneighbor::app {

// "[ts] [CONNECTED] IP: .. | MAC: .. | Vendor: .. | Interface: .."
[[nodiscard]] std::string format_event_line(const netneighbor::model::PresenceEvent& ev,
                                            const std::string& timestamp,
                                            const std::optional<std::string>& vendor,
                                            bool color);

// Console presentation of presence events.
class EventSink {
public:
  EventSink(std::ostream& out, const OuiTable* vendors, bool color);

  void emit(const netneighbor::model::PresenceEvent& ev);
  void emit_idle();
  void banner(const std::string& text);

private:
  std::ostream& out_;
  const OuiTable* vendors_;
  bool color_;
};

} // namespace netneighbor::app
