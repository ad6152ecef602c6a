// Registration Store
//
// Story:
// The store is the single owner of registration state. It indexes client
// records by endpoint and by registration id and makes every mutation atomic.
// The registry talks to it only through this interface, so a persistent
// backend can replace the in-memory one without touching the registry.
//
// Contract:
// - At most one record per endpoint. AddRegistration displaces the previous
//   holder of the endpoint and returns it.
// - At most one record per registration id. Callers must not add a record
//   whose id is held under a different endpoint.
// - Reads and removals return copies; callers never see live records.
// - Implementations must be thread-safe.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "client.h"

namespace registration {

class RegistrationStore {
 public:
  virtual ~RegistrationStore() = default;

  /// Stores a new registration.
  ///
  /// @param client The record to store. Endpoint and registration id must be
  ///               set.
  /// @return The registration previously held under the same endpoint, if any.
  virtual std::optional<Client> AddRegistration(const Client& client) = 0;

  /// Applies a partial update to an existing registration.
  ///
  /// @param update The update, keyed by registration id.
  /// @return The new state, or std::nullopt if the id is unknown.
  virtual std::optional<Client> UpdateRegistration(
      const ClientUpdate& update) = 0;

  /// Removes a registration.
  ///
  /// @param registration_id The registration to remove.
  /// @return The removed record, or std::nullopt if the id is unknown.
  virtual std::optional<Client> RemoveRegistration(
      const std::string& registration_id) = 0;

  /// Looks up a registration by id.
  virtual std::optional<Client> GetRegistration(
      const std::string& registration_id) const = 0;

  /// Looks up a registration by endpoint name.
  virtual std::optional<Client> GetRegistrationByEndpoint(
      const std::string& endpoint) const = 0;

  /// Returns a snapshot of every registration.
  virtual std::vector<Client> GetAllRegistrations() const = 0;
};

}  // namespace registration
