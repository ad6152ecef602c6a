// Client Record
//
// Story:
// A Client is the server-side state of one registered device: its identity
// (endpoint name + registration id), its lease (lifetime + last update time)
// and the protocol payload the device announced when it registered. A
// ClientUpdate carries the subset of fields a device may change without
// re-registering.
//
// Both types are plain values. The store owns the canonical copy; everything
// handed out by the registry is a copy.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace registration {

/// LWM2M transport binding modes.
enum class BindingMode {
  kU,    // UDP
  kUQ,   // UDP, queue mode
  kS,    // SMS
  kSQ,   // SMS, queue mode
  kUS,   // UDP and SMS
  kUQS,  // UDP queue mode and SMS
};

/// Returns the text form of a binding mode ("U", "UQ", ...).
std::string BindingModeToString(BindingMode mode);

/// Parses the text form of a binding mode.
/// @return The mode, or std::nullopt if the text is not a known mode.
std::optional<BindingMode> ParseBindingMode(const std::string& text);

/// State of one registered device.
struct Client {
  std::string registration_id;
  std::string endpoint;

  std::chrono::seconds lifetime{0};
  std::chrono::steady_clock::time_point registration_time;
  std::chrono::steady_clock::time_point last_update_time;

  // Opaque protocol payload, copied on register/update.
  std::string address;
  uint16_t port = 0;
  std::string sms_number;
  std::string lwm2m_version;
  BindingMode binding_mode = BindingMode::kU;
  std::vector<std::string> object_links;

  /// Returns the time point at which the lease runs out.
  ///
  /// Saturates at steady_clock::time_point::max() when last_update_time +
  /// lifetime + grace is not representable, so a very long lease never wraps
  /// into the past.
  std::chrono::steady_clock::time_point ExpirationTime(
      std::chrono::seconds grace = std::chrono::seconds(0)) const;

  /// Checks whether the lease is still running.
  ///
  /// @param now Current time.
  /// @param grace Extra time tolerated past the lifetime.
  /// @return true iff now < last_update_time + lifetime + grace.
  bool IsAlive(std::chrono::steady_clock::time_point now,
               std::chrono::seconds grace = std::chrono::seconds(0)) const {
    return now < ExpirationTime(grace);
  }
};

/// Partial update of a registration, keyed by registration id.
///
/// Absent fields are left unchanged when the update is applied.
struct ClientUpdate {
  std::string registration_id;

  std::optional<std::chrono::seconds> lifetime;
  std::optional<std::string> address;
  std::optional<uint16_t> port;
  std::optional<std::string> sms_number;
  std::optional<BindingMode> binding_mode;
  std::optional<std::vector<std::string>> object_links;

  // New lease baseline. Stamped by ClientRegistry::UpdateClient.
  std::chrono::steady_clock::time_point update_time;

  /// Returns a copy of `client` with this update applied.
  ///
  /// Identity (registration id, endpoint, registration time) is kept;
  /// last_update_time becomes update_time.
  Client ApplyTo(const Client& client) const;
};

bool operator==(const Client& lhs, const Client& rhs);
bool operator!=(const Client& lhs, const Client& rhs);

}  // namespace registration
