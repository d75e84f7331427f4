#include <ferry/health/server.hpp>

#include <grpcpp/health_check_service_interface.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace ferry::health {

bool pass_succeeded(
    const std::optional<ferry::schema::sync_statistics_t>& stats) {
  return stats && stats->files_failed == 0;
}

server::server(const ferry::common::context& context)
    : logger_{context.logger("health")} {}

server::~server() {
  shutdown();
}

void server::start(const std::string& address) {
  grpc::EnableDefaultHealthCheckService(true);

  auto builder = grpc::ServerBuilder{};
  builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &port_);
  server_ = builder.BuildAndStart();
  if (!server_ || port_ == 0) {
    server_.reset();
    throw std::runtime_error{"cannot start health server on " + address};
  }

  set_serving(false);
  set_sync_status(false);
  logger_->info("health service listening on {} (port {})", address, port_);
}

void server::set_serving(bool serving) {
  if (!server_) {
    return;
  }
  // The bool-only overload would also flip every named service.
  if (auto* service = server_->GetHealthCheckService()) {
    service->SetServingStatus("", serving);
  }
}

void server::set_sync_status(bool serving) {
  if (!server_) {
    return;
  }
  if (auto* service = server_->GetHealthCheckService()) {
    service->SetServingStatus(std::string{kSyncServiceName}, serving);
  }
}

void server::report_pass(
    const std::optional<ferry::schema::sync_statistics_t>& stats) {
  set_sync_status(pass_succeeded(stats));
}

void server::shutdown() {
  if (!server_) {
    return;
  }
  if (auto* service = server_->GetHealthCheckService()) {
    service->SetServingStatus(false);
  }
  server_->Shutdown(std::chrono::system_clock::now() +
                    std::chrono::seconds{2});
  server_.reset();
  logger_->info("health service stopped");
}

}  // namespace ferry::health
