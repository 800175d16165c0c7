#include "app/EventSink.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <ostream>

using netneighbor::ui::Color;
using netneighbor::ui::paint;

namespace netneighbor::app {

std::string format_event_line(const netneighbor::model::PresenceEvent& ev,
                              const std::string& timestamp,
                              const std::optional<std::string>& vendor,
                              bool color) {
  const bool up = ev.kind == netneighbor::model::PresenceKind::Connected;
  std::string tag = std::string("[") + netneighbor::model::kind_name(ev.kind) + "]";
  std::string line;
  line.reserve(128);
  line += "[" + timestamp + "] ";
  line += paint(tag, up ? Color::Green : Color::Red, color);
  line += " IP: " + paint(ev.device.ip_address, Color::Blue, color);
  line += " | MAC: " + paint(ev.device.mac_address, Color::Yellow, color);
  line += " | Vendor: " + (vendor ? paint(*vendor, Color::Cyan, color) : std::string("Unknown"));
  line += " | Interface: " + paint(ev.device.interface, Color::Magenta, color);
  return line;
}

EventSink::EventSink(std::ostream& out, const OuiTable* vendors, bool color)
    : out_(out), vendors_(vendors), color_(color) {}

void EventSink::emit(const netneighbor::model::PresenceEvent& ev) {
  std::optional<std::string> vendor;
  if (vendors_) vendor = vendors_->lookup(ev.device.mac_address);
  out_ << format_event_line(ev, netneighbor::ui::format_timestamp_now(), vendor, color_) << '\n';
  out_.flush();
}

void EventSink::emit_idle() {
  out_ << "[" << netneighbor::ui::format_timestamp_now() << "] No devices detected\n";
  out_.flush();
}

void EventSink::banner(const std::string& text) {
  out_ << text;
  out_.flush();
}

} // namespace netneighbor::app
