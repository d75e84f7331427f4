#pragma once

#include <ferry/common/context.hpp>
#include <ferry/schema/sync_statistics.hpp>

#include <grpcpp/grpcpp.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::health {

/// Health service name reporting the outcome of the latest pass.
inline constexpr auto kSyncServiceName = std::string_view{"ferry.sync"};

/// True when the pass ran to completion and no file failed.
bool pass_succeeded(
    const std::optional<ferry::schema::sync_statistics_t>& stats);

/// gRPC server exposing only the standard grpc.health.v1 service.
///
/// The overall status ("") follows set_serving(); `ferry.sync` follows
/// set_sync_status().
class server final {
 public:
  explicit server(const ferry::common::context& context);
  ~server();

  server(const server&) = delete;
  server& operator=(const server&) = delete;

  /// Bind and start serving. Throws std::runtime_error if the address
  /// cannot be bound.
  void start(const std::string& address);

  /// Port actually bound; useful with an ":0" address.
  int port() const { return port_; }

  bool running() const { return server_ != nullptr; }

  void set_serving(bool serving);
  void set_sync_status(bool serving);
  void report_pass(
      const std::optional<ferry::schema::sync_statistics_t>& stats);

  /// Mark everything NOT_SERVING and stop the server. Idempotent.
  void shutdown();

 private:
  std::unique_ptr<grpc::Server> server_;
  int port_{0};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace ferry::health
