// Client Registry
//
// Story:
// This module is the authoritative registry of connected devices. It brokers
// register/update/deregister requests against a RegistrationStore and fans out
// lifecycle events to listeners. Expiry is driven from outside by the
// RegistrationCleaner, which goes through DeregisterIfExpired.
//
// Algorithm:
// - The registry caches nothing; every read and write goes to the store
// - Registering on a held endpoint displaces the previous registration:
//   listeners see unregistered(previous) before registered(client)
// - Update, deregister and expiry of one registration id are serialized by a
//   striped per-id mutex, so an expiry check never acts on a lease that an
//   update has just refreshed
// - Listeners are kept in an immutable vector that is swapped on change;
//   each notification round iterates the snapshot taken when it started
//
// Thread Safety:
// All public methods are thread-safe. Listener callbacks run on the calling
// thread, after the store mutation, with no registry lock held. Events for
// one registration id are therefore not ordered across threads: an update
// racing a deregistration may deliver updated(c) after unregistered(c).
// Listeners that track state must treat an update for an id they have seen
// unregistered as stale.

#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "client.h"
#include "clock.h"
#include "registration_store.h"

namespace registration {

/// Listener interface for registration lifecycle events.
///
/// Implement this interface to react to devices joining, refreshing or
/// leaving. Callbacks are invoked synchronously from the thread performing
/// the operation and may call back into the registry.
class ClientRegistryListener {
 public:
  virtual ~ClientRegistryListener() = default;

  /// Called when a client registers.
  /// @param client The new registration.
  virtual void OnClientRegistered(const Client& client) = 0;

  /// Called when a registration is updated.
  /// @param update The update that was applied.
  /// @param client The registration after the update.
  virtual void OnClientUpdated(const ClientUpdate& update,
                               const Client& client) = 0;

  /// Called when a registration ends (explicit deregistration, expiry, or
  /// displacement by a new registration on the same endpoint).
  /// @param client The registration that was removed.
  virtual void OnClientUnregistered(const Client& client) = 0;
};

/// Registry of connected clients.
///
/// Example:
///   auto store = std::make_shared<InMemoryRegistrationStore>();
///   ClientRegistry registry(store);
///   registry.AddListener(&my_listener);
///   registry.RegisterClient(client);
///   registry.UpdateClient(update);
///   registry.DeregisterClient(client.registration_id);
class ClientRegistry {
 public:
  /// Constructs a client registry.
  ///
  /// @param store Backing store. Must not be null.
  /// @param clock Clock implementation for time. If nullptr, uses RealClock.
  /// @param grace_period Extra time tolerated past a client's lifetime before
  ///                     it counts as expired.
  explicit ClientRegistry(
      std::shared_ptr<RegistrationStore> store,
      std::shared_ptr<Clock> clock = nullptr,
      std::chrono::seconds grace_period = std::chrono::seconds(0));

  ~ClientRegistry() = default;

  // Non-copyable, non-movable
  ClientRegistry(const ClientRegistry&) = delete;
  ClientRegistry& operator=(const ClientRegistry&) = delete;

  /// Subscribes a listener. Adding a listener twice has no effect.
  ///
  /// A listener added while a notification round is running does not receive
  /// that round's event.
  ///
  /// @param listener Listener to add (not owned, must outlive the
  ///                 subscription).
  void AddListener(ClientRegistryListener* listener);

  /// Unsubscribes a listener. Unknown listeners are ignored.
  ///
  /// A round that started before the removal may still deliver its event.
  void RemoveListener(ClientRegistryListener* listener);

  /// Returns a snapshot of every registered client.
  std::vector<Client> AllClients() const;

  /// Returns the client registered under an endpoint, if any.
  std::optional<Client> Get(const std::string& endpoint) const;

  /// Returns the client with the given registration id, if any.
  std::optional<Client> FindByRegistrationId(
      const std::string& registration_id) const;

  /// Registers a client.
  ///
  /// Displaces any registration already held under the same endpoint.
  ///
  /// @param client The registration. Endpoint and registration id must be
  ///               set by the caller.
  /// @return true on success, false if endpoint or registration id is empty
  ///         or the registration id is held by another endpoint.
  bool RegisterClient(const Client& client);

  /// Applies a partial update to a registration and refreshes its lease.
  ///
  /// The update's update_time is stamped with the registry clock.
  ///
  /// @param update The update, keyed by registration id.
  /// @return The updated client, or std::nullopt if the id is empty or
  ///         unknown (no notification in that case).
  std::optional<Client> UpdateClient(const ClientUpdate& update);

  /// Deregisters a client.
  ///
  /// @param registration_id The registration to remove.
  /// @return The removed client, or std::nullopt if the id is empty or
  ///         unknown (no notification in that case).
  std::optional<Client> DeregisterClient(const std::string& registration_id);

  /// Checks a client's lease against the registry clock and grace period.
  bool IsExpired(const Client& client) const;

  /// Deregisters a client only if its current stored lease has expired.
  ///
  /// Re-reads the registration under the per-id lock, so a concurrent update
  /// that refreshed the lease wins. Notifies like DeregisterClient.
  ///
  /// @param registration_id The registration to check.
  /// @return The removed client, or std::nullopt if it is unknown or alive.
  std::optional<Client> DeregisterIfExpired(const std::string& registration_id);

 private:
  using ListenerList = std::vector<ClientRegistryListener*>;

  static constexpr size_t kLockStripes = 64;

  /// Returns the mutex guarding a registration id.
  std::mutex& LockFor(const std::string& registration_id) const;

  /// Returns the listener list to iterate for one notification round.
  std::shared_ptr<const ListenerList> ListenerSnapshot() const;

  void NotifyRegistered(const Client& client) const;
  void NotifyUpdated(const ClientUpdate& update, const Client& client) const;
  void NotifyUnregistered(const Client& client) const;

  // Dependencies
  std::shared_ptr<RegistrationStore> store_;
  std::shared_ptr<Clock> clock_;

  // Configuration
  std::chrono::seconds grace_period_;

  // Per-registration serialization of update/deregister/expire
  mutable std::array<std::mutex, kLockStripes> id_locks_;

  // Listeners (copy-on-write, guarded by listeners_mutex_)
  std::shared_ptr<const ListenerList> listeners_;
  mutable std::mutex listeners_mutex_;
};

}  // namespace registration
