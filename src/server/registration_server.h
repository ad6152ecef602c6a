// Registration Service gRPC Server Implementation
//
// Story:
// This module implements the gRPC service handlers. Handlers are thin - they
// validate input, translate between wire messages and Client/ClientUpdate,
// assign registration ids, and delegate to the ClientRegistry.
//
// Error Handling:
// - Uses gRPC error codes (INVALID_ARGUMENT, NOT_FOUND)
// - Empty endpoint / registration_id -> INVALID_ARGUMENT
// - Lifetime outside [0, kMaxLifetime], port > 65535, unknown binding mode
//   -> INVALID_ARGUMENT
// - Unknown registration / endpoint -> NOT_FOUND
//
// Thread Safety:
// Handlers delegate to the thread-safe registry. Id generation is guarded by
// its own mutex.

#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "client_registry.h"
#include "clock.h"
#include "registration_service.grpc.pb.h"

namespace registration {

/// Lifetime applied when a device does not announce one (LWM2M default).
constexpr std::chrono::seconds kDefaultLifetime{86400};

/// Longest lifetime a device may request (the LWM2M lifetime resource is an
/// unsigned 32-bit value).
constexpr std::chrono::seconds kMaxLifetime{0xFFFFFFFFLL};

/// Version assumed when a device does not announce one.
constexpr char kDefaultLwm2mVersion[] = "1.0";

/// Length of generated registration ids.
constexpr size_t kRegistrationIdLength = 10;

/// gRPC service implementation for device registration.
///
/// Example:
///   auto clock = std::make_shared<RealClock>();
///   ClientRegistry registry(store, clock);
///   RegistrationServiceImpl service(&registry, clock);
///   // Use service with grpc::ServerBuilder
class RegistrationServiceImpl final : public RegistrationService::Service {
 public:
  /// Constructs the service implementation.
  ///
  /// @param client_registry Registry to delegate to (not owned, must outlive
  ///                        this object).
  /// @param clock Clock used to stamp new registrations. If nullptr, uses
  ///              RealClock. Should be the clock the registry uses.
  explicit RegistrationServiceImpl(ClientRegistry* client_registry,
                                   std::shared_ptr<Clock> clock = nullptr);

  ~RegistrationServiceImpl() override = default;

  // Non-copyable, non-movable
  RegistrationServiceImpl(const RegistrationServiceImpl&) = delete;
  RegistrationServiceImpl& operator=(const RegistrationServiceImpl&) = delete;

  // =========================================================================
  // gRPC Service Methods
  // =========================================================================

  /// Registers a device under a freshly generated registration id.
  /// @return INVALID_ARGUMENT on a malformed request.
  grpc::Status Register(grpc::ServerContext* context,
                        const RegisterRequest* request,
                        RegisterResponse* response) override;

  /// Updates a registration.
  /// @return INVALID_ARGUMENT on a malformed request, NOT_FOUND if unknown.
  grpc::Status Update(grpc::ServerContext* context,
                      const UpdateRequest* request,
                      UpdateResponse* response) override;

  /// Deregisters a device.
  /// @return INVALID_ARGUMENT if registration_id empty, NOT_FOUND if unknown.
  grpc::Status Deregister(grpc::ServerContext* context,
                          const DeregisterRequest* request,
                          DeregisterResponse* response) override;

  /// Looks up one registration.
  /// @return INVALID_ARGUMENT if no key is set, NOT_FOUND if absent.
  grpc::Status GetClient(grpc::ServerContext* context,
                         const GetClientRequest* request,
                         GetClientResponse* response) override;

  /// Lists all registrations.
  /// @return Always OK.
  grpc::Status ListClients(grpc::ServerContext* context,
                           const ListClientsRequest* request,
                           ListClientsResponse* response) override;

 private:
  /// Returns a random id not held by any live registration.
  std::string GenerateRegistrationId();

  /// Fills a wire ClientInfo from a client record.
  void ToClientInfo(const Client& client, ClientInfo* info) const;

  ClientRegistry* client_registry_;
  std::shared_ptr<Clock> clock_;

  // Registration id generation (protected by id_mutex_)
  std::mt19937_64 id_engine_;
  std::mutex id_mutex_;
};

}  // namespace registration
