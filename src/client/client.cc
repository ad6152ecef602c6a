// Client Record - Implementation
//
// See client.h for the Story.

#include "client.h"

namespace registration {

namespace {

using ClockDuration = std::chrono::steady_clock::duration;

// Converts seconds to clock ticks, clamped to the representable range.
ClockDuration ToClockDuration(std::chrono::seconds value) {
  constexpr auto kMaxSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(ClockDuration::max());
  constexpr auto kMinSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(ClockDuration::min());
  if (value > kMaxSeconds) {
    return ClockDuration::max();
  }
  if (value < kMinSeconds) {
    return ClockDuration::min();
  }
  return std::chrono::duration_cast<ClockDuration>(value);
}

ClockDuration SaturatingAdd(ClockDuration a, ClockDuration b) {
  if (b > ClockDuration::zero() && a > ClockDuration::max() - b) {
    return ClockDuration::max();
  }
  if (b < ClockDuration::zero() && a < ClockDuration::min() - b) {
    return ClockDuration::min();
  }
  return a + b;
}

}  // namespace

std::chrono::steady_clock::time_point Client::ExpirationTime(
    std::chrono::seconds grace) const {
  ClockDuration lease =
      SaturatingAdd(ToClockDuration(lifetime), ToClockDuration(grace));
  return std::chrono::steady_clock::time_point(
      SaturatingAdd(last_update_time.time_since_epoch(), lease));
}

std::string BindingModeToString(BindingMode mode) {
  switch (mode) {
    case BindingMode::kU:
      return "U";
    case BindingMode::kUQ:
      return "UQ";
    case BindingMode::kS:
      return "S";
    case BindingMode::kSQ:
      return "SQ";
    case BindingMode::kUS:
      return "US";
    case BindingMode::kUQS:
      return "UQS";
  }
  return "U";
}

std::optional<BindingMode> ParseBindingMode(const std::string& text) {
  if (text == "U") return BindingMode::kU;
  if (text == "UQ") return BindingMode::kUQ;
  if (text == "S") return BindingMode::kS;
  if (text == "SQ") return BindingMode::kSQ;
  if (text == "US") return BindingMode::kUS;
  if (text == "UQS") return BindingMode::kUQS;
  return std::nullopt;
}

Client ClientUpdate::ApplyTo(const Client& client) const {
  Client updated = client;

  if (lifetime.has_value()) {
    updated.lifetime = *lifetime;
  }
  if (address.has_value()) {
    updated.address = *address;
  }
  if (port.has_value()) {
    updated.port = *port;
  }
  if (sms_number.has_value()) {
    updated.sms_number = *sms_number;
  }
  if (binding_mode.has_value()) {
    updated.binding_mode = *binding_mode;
  }
  if (object_links.has_value()) {
    updated.object_links = *object_links;
  }

  // Refresh the lease
  updated.last_update_time = update_time;
  return updated;
}

bool operator==(const Client& lhs, const Client& rhs) {
  return lhs.registration_id == rhs.registration_id &&
         lhs.endpoint == rhs.endpoint && lhs.lifetime == rhs.lifetime &&
         lhs.registration_time == rhs.registration_time &&
         lhs.last_update_time == rhs.last_update_time &&
         lhs.address == rhs.address && lhs.port == rhs.port &&
         lhs.sms_number == rhs.sms_number &&
         lhs.lwm2m_version == rhs.lwm2m_version &&
         lhs.binding_mode == rhs.binding_mode &&
         lhs.object_links == rhs.object_links;
}

bool operator!=(const Client& lhs, const Client& rhs) {
  return !(lhs == rhs);
}

}  // namespace registration
