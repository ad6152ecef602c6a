// Client Registry - Implementation
//
// See client_registry.h for the Story and algorithm description.

#include "client_registry.h"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

namespace registration {

ClientRegistry::ClientRegistry(std::shared_ptr<RegistrationStore> store,
                               std::shared_ptr<Clock> clock,
                               std::chrono::seconds grace_period)
    : store_(std::move(store)),
      clock_(clock ? std::move(clock) : std::make_shared<RealClock>()),
      grace_period_(grace_period),
      listeners_(std::make_shared<const ListenerList>()) {
  if (!store_) {
    throw std::invalid_argument("ClientRegistry requires a store");
  }
}

void ClientRegistry::AddListener(ClientRegistryListener* listener) {
  if (listener == nullptr) {
    return;
  }

  std::lock_guard<std::mutex> lock(listeners_mutex_);
  if (std::find(listeners_->begin(), listeners_->end(), listener) !=
      listeners_->end()) {
    return;  // Already subscribed
  }

  auto updated = std::make_shared<ListenerList>(*listeners_);
  updated->push_back(listener);
  listeners_ = std::move(updated);
}

void ClientRegistry::RemoveListener(ClientRegistryListener* listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  auto it = std::find(listeners_->begin(), listeners_->end(), listener);
  if (it == listeners_->end()) {
    return;
  }

  auto updated = std::make_shared<ListenerList>(*listeners_);
  updated->erase(updated->begin() + (it - listeners_->begin()));
  listeners_ = std::move(updated);
}

std::vector<Client> ClientRegistry::AllClients() const {
  return store_->GetAllRegistrations();
}

std::optional<Client> ClientRegistry::Get(const std::string& endpoint) const {
  return store_->GetRegistrationByEndpoint(endpoint);
}

std::optional<Client> ClientRegistry::FindByRegistrationId(
    const std::string& registration_id) const {
  return store_->GetRegistration(registration_id);
}

bool ClientRegistry::RegisterClient(const Client& client) {
  if (client.endpoint.empty() || client.registration_id.empty()) {
    return false;
  }

  std::optional<Client> previous;
  {
    std::lock_guard<std::mutex> lock(LockFor(client.registration_id));

    // A registration id names exactly one record
    std::optional<Client> holder = store_->GetRegistration(
        client.registration_id);
    if (holder.has_value() && holder->endpoint != client.endpoint) {
      return false;
    }
    previous = store_->AddRegistration(client);
  }

  // Displaced registration leaves before the new one joins
  if (previous.has_value()) {
    NotifyUnregistered(*previous);
  }
  NotifyRegistered(client);

  return true;
}

std::optional<Client> ClientRegistry::UpdateClient(const ClientUpdate& update) {
  if (update.registration_id.empty()) {
    return std::nullopt;
  }

  ClientUpdate stamped = update;
  std::optional<Client> updated;
  {
    std::lock_guard<std::mutex> lock(LockFor(update.registration_id));
    stamped.update_time = clock_->Now();
    updated = store_->UpdateRegistration(stamped);
  }

  if (!updated.has_value()) {
    return std::nullopt;  // Unknown registration
  }

  NotifyUpdated(stamped, *updated);
  return updated;
}

std::optional<Client> ClientRegistry::DeregisterClient(
    const std::string& registration_id) {
  if (registration_id.empty()) {
    return std::nullopt;
  }

  std::optional<Client> removed;
  {
    std::lock_guard<std::mutex> lock(LockFor(registration_id));
    removed = store_->RemoveRegistration(registration_id);
  }

  if (removed.has_value()) {
    NotifyUnregistered(*removed);
  }
  return removed;
}

bool ClientRegistry::IsExpired(const Client& client) const {
  return !client.IsAlive(clock_->Now(), grace_period_);
}

std::optional<Client> ClientRegistry::DeregisterIfExpired(
    const std::string& registration_id) {
  if (registration_id.empty()) {
    return std::nullopt;
  }

  std::optional<Client> removed;
  {
    std::lock_guard<std::mutex> lock(LockFor(registration_id));

    // Judge the stored lease, not the caller's possibly stale copy
    std::optional<Client> current = store_->GetRegistration(registration_id);
    if (!current.has_value() || !IsExpired(*current)) {
      return std::nullopt;
    }
    removed = store_->RemoveRegistration(registration_id);
  }

  if (removed.has_value()) {
    NotifyUnregistered(*removed);
  }
  return removed;
}

std::mutex& ClientRegistry::LockFor(const std::string& registration_id) const {
  return id_locks_[std::hash<std::string>{}(registration_id) % kLockStripes];
}

std::shared_ptr<const ClientRegistry::ListenerList>
ClientRegistry::ListenerSnapshot() const {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  return listeners_;
}

void ClientRegistry::NotifyRegistered(const Client& client) const {
  std::shared_ptr<const ListenerList> listeners = ListenerSnapshot();
  for (ClientRegistryListener* listener : *listeners) {
    listener->OnClientRegistered(client);
  }
}

void ClientRegistry::NotifyUpdated(const ClientUpdate& update,
                                   const Client& client) const {
  std::shared_ptr<const ListenerList> listeners = ListenerSnapshot();
  for (ClientRegistryListener* listener : *listeners) {
    listener->OnClientUpdated(update, client);
  }
}

void ClientRegistry::NotifyUnregistered(const Client& client) const {
  std::shared_ptr<const ListenerList> listeners = ListenerSnapshot();
  for (ClientRegistryListener* listener : *listeners) {
    listener->OnClientUnregistered(client);
  }
}

}  // namespace registration
