// Registration Service gRPC Server - Implementation
//
// See registration_server.h for the Story and design description.

#include "registration_server.h"

#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace registration {

namespace {

constexpr char kIdAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

/// Marks a response as failed and returns the matching status.
template <typename Response>
grpc::Status Reject(Response* response, grpc::StatusCode code,
                    const std::string& message) {
  response->set_success(false);
  response->set_error_message(message);
  return grpc::Status(code, message);
}

int64_t MillisBetween(std::chrono::steady_clock::time_point from,
                      std::chrono::steady_clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
      .count();
}

}  // namespace

RegistrationServiceImpl::RegistrationServiceImpl(ClientRegistry* client_registry,
                                                 std::shared_ptr<Clock> clock)
    : client_registry_(client_registry),
      clock_(clock ? std::move(clock) : std::make_shared<RealClock>()),
      id_engine_(std::random_device{}()) {}

grpc::Status RegistrationServiceImpl::Register(
    grpc::ServerContext* /*context*/,
    const RegisterRequest* request,
    RegisterResponse* response) {
  // Validate input
  if (request->endpoint().empty()) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "endpoint cannot be empty");
  }
  if (request->lifetime_seconds() < 0 ||
      request->lifetime_seconds() > kMaxLifetime.count()) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "lifetime_seconds out of range");
  }
  if (request->port() > std::numeric_limits<uint16_t>::max()) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "port must be <= 65535");
  }

  BindingMode binding_mode = BindingMode::kU;
  if (!request->binding_mode().empty()) {
    auto parsed = ParseBindingMode(request->binding_mode());
    if (!parsed.has_value()) {
      return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                    "unknown binding_mode: " + request->binding_mode());
    }
    binding_mode = *parsed;
  }

  // Build the registration
  Client client;
  client.registration_id = GenerateRegistrationId();
  client.endpoint = request->endpoint();
  client.lifetime = request->lifetime_seconds() == 0
                        ? kDefaultLifetime
                        : std::chrono::seconds(request->lifetime_seconds());
  client.registration_time = clock_->Now();
  client.last_update_time = client.registration_time;
  client.address = request->address();
  client.port = static_cast<uint16_t>(request->port());
  client.sms_number = request->sms_number();
  client.lwm2m_version = request->lwm2m_version().empty()
                             ? kDefaultLwm2mVersion
                             : request->lwm2m_version();
  client.binding_mode = binding_mode;
  client.object_links.assign(request->object_links().begin(),
                             request->object_links().end());

  if (!client_registry_->RegisterClient(client)) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "registration rejected");
  }

  response->set_success(true);
  response->set_registration_id(client.registration_id);
  return grpc::Status::OK;
}

grpc::Status RegistrationServiceImpl::Update(
    grpc::ServerContext* /*context*/,
    const UpdateRequest* request,
    UpdateResponse* response) {
  // Validate input
  if (request->registration_id().empty()) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "registration_id cannot be empty");
  }

  ClientUpdate update;
  update.registration_id = request->registration_id();

  if (request->has_lifetime_seconds()) {
    if (request->lifetime_seconds() < 0 ||
        request->lifetime_seconds() > kMaxLifetime.count()) {
      return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                    "lifetime_seconds out of range");
    }
    update.lifetime = request->lifetime_seconds() == 0
                          ? kDefaultLifetime
                          : std::chrono::seconds(request->lifetime_seconds());
  }
  if (request->has_address()) {
    update.address = request->address();
  }
  if (request->has_port()) {
    if (request->port() > std::numeric_limits<uint16_t>::max()) {
      return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                    "port must be <= 65535");
    }
    update.port = static_cast<uint16_t>(request->port());
  }
  if (request->has_sms_number()) {
    update.sms_number = request->sms_number();
  }
  if (request->has_binding_mode()) {
    auto parsed = ParseBindingMode(request->binding_mode());
    if (!parsed.has_value()) {
      return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                    "unknown binding_mode: " + request->binding_mode());
    }
    update.binding_mode = *parsed;
  }
  if (request->has_object_links()) {
    update.object_links = std::vector<std::string>(
        request->object_links().links().begin(),
        request->object_links().links().end());
  }

  // Apply the update
  auto updated = client_registry_->UpdateClient(update);
  if (!updated.has_value()) {
    return Reject(response, grpc::StatusCode::NOT_FOUND,
                  "registration not found");
  }

  response->set_success(true);
  ToClientInfo(*updated, response->mutable_client());
  return grpc::Status::OK;
}

grpc::Status RegistrationServiceImpl::Deregister(
    grpc::ServerContext* /*context*/,
    const DeregisterRequest* request,
    DeregisterResponse* response) {
  if (request->registration_id().empty()) {
    return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                  "registration_id cannot be empty");
  }

  auto removed = client_registry_->DeregisterClient(request->registration_id());
  if (!removed.has_value()) {
    return Reject(response, grpc::StatusCode::NOT_FOUND,
                  "registration not found");
  }

  response->set_success(true);
  ToClientInfo(*removed, response->mutable_client());
  return grpc::Status::OK;
}

grpc::Status RegistrationServiceImpl::GetClient(
    grpc::ServerContext* /*context*/,
    const GetClientRequest* request,
    GetClientResponse* response) {
  std::optional<Client> client;
  switch (request->key_case()) {
    case GetClientRequest::kEndpoint:
      client = client_registry_->Get(request->endpoint());
      break;
    case GetClientRequest::kRegistrationId:
      client = client_registry_->FindByRegistrationId(
          request->registration_id());
      break;
    case GetClientRequest::KEY_NOT_SET:
      return Reject(response, grpc::StatusCode::INVALID_ARGUMENT,
                    "endpoint or registration_id required");
  }

  if (!client.has_value()) {
    return Reject(response, grpc::StatusCode::NOT_FOUND, "client not found");
  }

  response->set_success(true);
  ToClientInfo(*client, response->mutable_client());
  return grpc::Status::OK;
}

grpc::Status RegistrationServiceImpl::ListClients(
    grpc::ServerContext* /*context*/,
    const ListClientsRequest* /*request*/,
    ListClientsResponse* response) {
  for (const Client& client : client_registry_->AllClients()) {
    ToClientInfo(client, response->add_clients());
  }
  return grpc::Status::OK;
}

std::string RegistrationServiceImpl::GenerateRegistrationId() {
  std::lock_guard<std::mutex> lock(id_mutex_);
  std::uniform_int_distribution<size_t> pick(0, sizeof(kIdAlphabet) - 2);

  std::string id;
  do {
    id.clear();
    for (size_t i = 0; i < kRegistrationIdLength; ++i) {
      id.push_back(kIdAlphabet[pick(id_engine_)]);
    }
  } while (client_registry_->FindByRegistrationId(id).has_value());

  return id;
}

void RegistrationServiceImpl::ToClientInfo(const Client& client,
                                           ClientInfo* info) const {
  auto now = clock_->Now();

  info->set_registration_id(client.registration_id);
  info->set_endpoint(client.endpoint);
  info->set_lifetime_seconds(client.lifetime.count());
  info->set_millis_since_last_update(MillisBetween(client.last_update_time, now));
  info->set_millis_since_registration(
      MillisBetween(client.registration_time, now));
  info->set_address(client.address);
  info->set_port(client.port);
  info->set_sms_number(client.sms_number);
  info->set_lwm2m_version(client.lwm2m_version);
  info->set_binding_mode(BindingModeToString(client.binding_mode));
  for (const std::string& link : client.object_links) {
    info->add_object_links(link);
  }
}

}  // namespace registration
