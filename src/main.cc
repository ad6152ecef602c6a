// Registration Service - Main Application
//
// Story:
// Entry point for the registration server. Initializes the store, registry
// and cleaner, starts the gRPC server, and handles graceful shutdown on
// SIGINT/SIGTERM.
//
// Usage:
//   ./registration_server [--port=PORT] [--cleanup-period-ms=MS] ...
//
// Options:
//   --port=PORT                Server port (default: 50051)
//   --cleanup-period-ms=MS     Expired registration sweep period (default: 2000)
//   --shutdown-timeout-ms=MS   Max wait for a running sweep on shutdown
//                              (default: 5000)
//   --grace-period=SEC         Extra seconds tolerated past a lifetime
//                              (default: 0)
//   --verbose                  Log registration events
//   --help                     Show usage

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "client_registry.h"
#include "clock.h"
#include "in_memory_registration_store.h"
#include "registration_cleaner.h"
#include "registration_server.h"

namespace {

// =============================================================================
// Configuration
// =============================================================================

struct ServerConfig {
  uint16_t port = 50051;
  std::chrono::milliseconds cleanup_period{2000};
  std::chrono::milliseconds shutdown_timeout{5000};
  std::chrono::seconds grace_period{0};
  bool verbose = false;
};

// =============================================================================
// Global State (for signal handling)
// =============================================================================

std::atomic<bool> g_shutdown_requested{false};
std::mutex g_shutdown_mutex;
std::condition_variable g_shutdown_cv;

// =============================================================================
// Signal Handler
// =============================================================================

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
    g_shutdown_cv.notify_all();
  }
}

// =============================================================================
// Event Logging
// =============================================================================

/// Prints registration lifecycle events to stdout (--verbose).
class EventLogger : public registration::ClientRegistryListener {
 public:
  void OnClientRegistered(const registration::Client& client) override {
    std::cout << "Registered " << client.endpoint << " ("
              << client.registration_id << ", lifetime "
              << client.lifetime.count() << "s, binding "
              << registration::BindingModeToString(client.binding_mode) << ")"
              << std::endl;
  }

  void OnClientUpdated(const registration::ClientUpdate& /*update*/,
                       const registration::Client& client) override {
    std::cout << "Updated " << client.endpoint << " ("
              << client.registration_id << ", lifetime "
              << client.lifetime.count() << "s)" << std::endl;
  }

  void OnClientUnregistered(const registration::Client& client) override {
    std::cout << "Deregistered " << client.endpoint << " ("
              << client.registration_id << ")" << std::endl;
  }
};

// =============================================================================
// Command-Line Parsing
// =============================================================================

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Options:\n"
            << "  --port=PORT               Server port (default: 50051)\n"
            << "  --cleanup-period-ms=MS    Expired registration sweep period "
               "(default: 2000)\n"
            << "  --shutdown-timeout-ms=MS  Max wait for a running sweep on "
               "shutdown (default: 5000)\n"
            << "  --grace-period=SEC        Extra seconds tolerated past a "
               "lifetime (default: 0)\n"
            << "  --verbose                 Log registration events\n"
            << "  --help                    Show this help message\n";
}

/// Parses the integer value of a --flag=value argument.
/// Prints an error and returns std::nullopt if it is not an integer >= min.
std::optional<long long> ParseIntFlag(const std::string& arg, size_t prefix_len,
                                      long long min_value,
                                      const char* description) {
  std::string value = arg.substr(prefix_len);
  try {
    size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != value.size() || parsed < min_value) {
      std::cerr << "Error: Invalid " << description << ": " << value
                << std::endl;
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    std::cerr << "Error: Invalid " << description << ": " << value << std::endl;
    return std::nullopt;
  }
}

std::optional<ServerConfig> ParseArgs(int argc, char* argv[]) {
  ServerConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return std::nullopt;
    }

    if (arg == "--verbose" || arg == "-v") {
      config.verbose = true;
      continue;
    }

    if (arg.rfind("--port=", 0) == 0) {
      auto port = ParseIntFlag(arg, 7, 1, "port number");
      if (!port) {
        return std::nullopt;
      }
      if (*port > 65535) {
        std::cerr << "Error: Invalid port number: " << *port << std::endl;
        return std::nullopt;
      }
      config.port = static_cast<uint16_t>(*port);
      continue;
    }

    if (arg.rfind("--cleanup-period-ms=", 0) == 0) {
      auto period = ParseIntFlag(arg, 20, 1, "cleanup period");
      if (!period) {
        return std::nullopt;
      }
      config.cleanup_period = std::chrono::milliseconds(*period);
      continue;
    }

    if (arg.rfind("--shutdown-timeout-ms=", 0) == 0) {
      auto timeout = ParseIntFlag(arg, 22, 0, "shutdown timeout");
      if (!timeout) {
        return std::nullopt;
      }
      config.shutdown_timeout = std::chrono::milliseconds(*timeout);
      continue;
    }

    if (arg.rfind("--grace-period=", 0) == 0) {
      auto grace = ParseIntFlag(arg, 15, 0, "grace period");
      if (!grace) {
        return std::nullopt;
      }
      if (*grace > registration::kMaxLifetime.count()) {
        std::cerr << "Error: Invalid grace period: " << *grace << std::endl;
        return std::nullopt;
      }
      config.grace_period = std::chrono::seconds(*grace);
      continue;
    }

    std::cerr << "Error: Unknown argument: " << arg << std::endl;
    PrintUsage(argv[0]);
    return std::nullopt;
  }

  return config;
}

// =============================================================================
// Server Runner
// =============================================================================

int RunServer(const ServerConfig& config) {
  // Build server address
  std::string server_address = "0.0.0.0:" + std::to_string(config.port);

  // Create components
  auto clock = std::make_shared<registration::RealClock>();
  auto store = std::make_shared<registration::InMemoryRegistrationStore>();
  registration::ClientRegistry client_registry(store, clock,
                                               config.grace_period);
  registration::RegistrationCleaner cleaner(
      &client_registry, config.cleanup_period, config.shutdown_timeout);

  EventLogger event_logger;
  if (config.verbose) {
    client_registry.AddListener(&event_logger);
  }

  // Create service implementation
  registration::RegistrationServiceImpl service(&client_registry, clock);

  // Build and start server
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    std::cerr << "Error: Failed to start server on " << server_address
              << std::endl;
    return 1;
  }

  cleaner.Start();

  std::cout << "Registration server started on " << server_address
            << std::endl;
  std::cout << "Cleanup period: " << config.cleanup_period.count() << " ms"
            << std::endl;
  std::cout << "Press Ctrl+C to shutdown..." << std::endl;

  // Start a thread that waits for shutdown signal and calls server->Shutdown()
  std::thread shutdown_thread([&server]() {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.wait(lock, []() { return g_shutdown_requested.load(); });

    std::cout << "\nShutdown requested, stopping server..." << std::endl;
    server->Shutdown();
  });

  // Wait for server to finish (will unblock when Shutdown() is called)
  server->Wait();

  // Wait for shutdown thread to complete
  shutdown_thread.join();

  // Stop sweeping before the registry goes away
  cleaner.Stop();
  client_registry.RemoveListener(&event_logger);

  std::cout << "Server shutdown complete." << std::endl;

  return 0;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  // Parse command-line arguments
  auto config = ParseArgs(argc, argv);
  if (!config) {
    return 1;
  }

  // Setup signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Run the server
  return RunServer(*config);
}
