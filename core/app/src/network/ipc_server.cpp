#include "lendswap/network/ipc_server.hpp"

#include "lendswap/domain/position_status.hpp"
#include "lendswap/math/checked_math.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <utility>

namespace lendswap {

namespace {

std::string amountString(math::TokenAmount amount) {
  return math::toString(amount.value());
}

std::int64_t epochMillis(const Timestamp& stamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             stamp.time_since_epoch())
      .count();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish what was queued before shutdown.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<ReserveUpdateEvent>(&event)) {
    return formatReserveUpdate(*e);
  }
  if (auto* e = std::get_if<OperationRejectedEvent>(&event)) {
    return formatOperationRejected(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  const domain::Position& p = e.position;
  nlohmann::json j;
  j["type"] = "position_update";
  j["operation"] = e.operation;
  j["trader"] = p.trader;
  j["market"] = p.market;
  j["status"] = domain::positionStatusToString(p.status);
  j["loan"] = amountString(p.state.loan);
  j["debt"] = amountString(p.state.amount);
  j["rate"] = math::toString(p.state.rate.value());
  j["checkpoint"] = p.state.timestamp.value();
  j["receipt_balance"] = amountString(e.receipt_balance);
  j["market_total_loan"] = amountString(e.market_total_loan);
  j["timestamp_ms"] = epochMillis(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatReserveUpdate(const ReserveUpdateEvent& e) {
  const domain::Reserve& r = e.reserve;
  nlohmann::json j;
  j["type"] = "reserve_update";
  j["operation"] = e.operation;
  j["reserve"] = r.id;
  j["borrow_rate"] = math::toString(r.state.borrow_rate.value());
  j["treasure_accrued"] = amountString(r.state.treasure_accrued);
  j["total_debt"] = amountString(r.debt.total);
  j["average_rate"] = math::toString(r.debt.average_rate.value());
  j["vault_balance"] = amountString(e.vault_balance);
  j["redeemable_supply"] = amountString(e.redeemable_supply);
  j["timestamp_ms"] = epochMillis(e.timestamp);
  return j.dump();
}

std::string IpcServer::formatOperationRejected(
    const OperationRejectedEvent& e) {
  nlohmann::json j;
  j["type"] = "operation_rejected";
  j["operation"] = e.operation;
  j["subject"] = e.subject;
  j["code"] = domain::errorCodeToString(e.code);
  j["message"] = e.message;
  j["timestamp_ms"] = epochMillis(e.timestamp);
  return j.dump();
}

}  // namespace lendswap
