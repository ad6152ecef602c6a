// In-Memory Registration Store - Implementation
//
// See in_memory_registration_store.h for the Story.

#include "in_memory_registration_store.h"

#include <utility>

namespace registration {

std::optional<Client> InMemoryRegistrationStore::AddRegistration(
    const Client& client) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::optional<Client> previous;
  auto it = clients_by_endpoint_.find(client.endpoint);
  if (it != clients_by_endpoint_.end()) {
    previous = std::move(it->second);
    endpoint_by_registration_id_.erase(previous->registration_id);
    clients_by_endpoint_.erase(it);
  }

  clients_by_endpoint_.emplace(client.endpoint, client);
  endpoint_by_registration_id_[client.registration_id] = client.endpoint;
  return previous;
}

std::optional<Client> InMemoryRegistrationStore::UpdateRegistration(
    const ClientUpdate& update) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto id_it = endpoint_by_registration_id_.find(update.registration_id);
  if (id_it == endpoint_by_registration_id_.end()) {
    return std::nullopt;
  }

  auto it = clients_by_endpoint_.find(id_it->second);
  if (it == clients_by_endpoint_.end()) {
    return std::nullopt;
  }

  it->second = update.ApplyTo(it->second);
  return it->second;
}

std::optional<Client> InMemoryRegistrationStore::RemoveRegistration(
    const std::string& registration_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto id_it = endpoint_by_registration_id_.find(registration_id);
  if (id_it == endpoint_by_registration_id_.end()) {
    return std::nullopt;
  }

  auto it = clients_by_endpoint_.find(id_it->second);
  endpoint_by_registration_id_.erase(id_it);
  if (it == clients_by_endpoint_.end()) {
    return std::nullopt;
  }

  Client removed = std::move(it->second);
  clients_by_endpoint_.erase(it);
  return removed;
}

std::optional<Client> InMemoryRegistrationStore::GetRegistration(
    const std::string& registration_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto id_it = endpoint_by_registration_id_.find(registration_id);
  if (id_it == endpoint_by_registration_id_.end()) {
    return std::nullopt;
  }

  auto it = clients_by_endpoint_.find(id_it->second);
  if (it == clients_by_endpoint_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Client> InMemoryRegistrationStore::GetRegistrationByEndpoint(
    const std::string& endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = clients_by_endpoint_.find(endpoint);
  if (it == clients_by_endpoint_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Client> InMemoryRegistrationStore::GetAllRegistrations() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Client> clients;
  clients.reserve(clients_by_endpoint_.size());
  for (const auto& [endpoint, client] : clients_by_endpoint_) {
    clients.push_back(client);
  }
  return clients;
}

}  // namespace registration
