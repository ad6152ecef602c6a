// In-Memory Registration Store
//
// Story:
// Default RegistrationStore backend. Keeps records in a map keyed by endpoint
// with a reverse index from registration id to endpoint.
//
// Thread Safety:
// All public methods are thread-safe (protected by mutex).

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "registration_store.h"

namespace registration {

/// Thread-safe, non-persistent RegistrationStore.
///
/// Example:
///   auto store = std::make_shared<InMemoryRegistrationStore>();
///   ClientRegistry registry(store);
class InMemoryRegistrationStore : public RegistrationStore {
 public:
  InMemoryRegistrationStore() = default;
  ~InMemoryRegistrationStore() override = default;

  // Non-copyable, non-movable
  InMemoryRegistrationStore(const InMemoryRegistrationStore&) = delete;
  InMemoryRegistrationStore& operator=(const InMemoryRegistrationStore&) =
      delete;

  std::optional<Client> AddRegistration(const Client& client) override;

  std::optional<Client> UpdateRegistration(const ClientUpdate& update) override;

  std::optional<Client> RemoveRegistration(
      const std::string& registration_id) override;

  std::optional<Client> GetRegistration(
      const std::string& registration_id) const override;

  std::optional<Client> GetRegistrationByEndpoint(
      const std::string& endpoint) const override;

  std::vector<Client> GetAllRegistrations() const override;

 private:
  // endpoint -> record
  std::map<std::string, Client> clients_by_endpoint_;

  // registration id -> endpoint
  std::map<std::string, std::string> endpoint_by_registration_id_;

  mutable std::mutex mutex_;
};

}  // namespace registration
