/**
 * @file ZMQAlertPublisher.hpp
 * @brief ZeroMQ delivery of SLO alert batches
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <zmq.hpp>

#include "pipemon/core/Logger.hpp"
#include "pipemon/monitor/AlertSink.hpp"

namespace PIPEMON::Sink
{

/**
 * @brief Configuration for the alert channel
 *
 * @par Usage Example:
 * @code{.cpp}
 * AlertChannelConfig config;
 * config.address = "tcp://*:5590";
 * config.bind = true;
 * config.pattern = "PUB";
 *
 * ZMQAlertPublisher publisher;
 * publisher.Configure(config);
 * publisher.Connect();
 * @endcode
 */
struct AlertChannelConfig {
  std::string address = "tcp://*:5590";  ///< Alert channel endpoint
  bool bind = true;  ///< True to bind the socket, false to connect

  /**
   * @brief Socket pattern
   *
   * Publisher: "PUB" (broadcast) or "PUSH" (load-balanced).
   * Subscriber: "SUB" or "PULL".
   */
  std::string pattern = "PUB";

  int receive_timeout_ms = 1000;  ///< Subscriber only
};

/**
 * @brief IAlertSink publishing each batch as one JSON message
 *
 * The message is the batch's JSON projection with
 * alert_type = "slo_violation". Sends never block: with no PUSH peer the
 * send fails with TRANSPORT_ERROR, PUB drops silently without subscribers.
 */
class ZMQAlertPublisher : public Monitor::IAlertSink
{
 public:
  ZMQAlertPublisher();
  ~ZMQAlertPublisher() override;

  bool Configure(const AlertChannelConfig &config);
  bool ConfigureFromJSON(const nlohmann::json &config);
  bool Connect();
  void Disconnect();
  bool IsConnected() const;

  Status SendAlert(const Monitor::AlertBatch &batch) override;

  uint64_t GetSentCount() const { return fSentCount; }

 private:
  bool fConnected = false;
  bool fConfigured = false;
  AlertChannelConfig fConfig;
  uint64_t fSentCount = 0;

  std::unique_ptr<zmq::context_t> fContext;
  std::unique_ptr<zmq::socket_t> fSocket;
  mutable std::mutex fSocketMutex;
  std::shared_ptr<Logger> fLogger;
};

/**
 * @brief Receiving end of an alert channel (SUB or PULL)
 */
class ZMQAlertSubscriber
{
 public:
  ZMQAlertSubscriber();
  ~ZMQAlertSubscriber();

  bool Configure(const AlertChannelConfig &config);
  bool Connect();
  void Disconnect();
  bool IsConnected() const { return fConnected; }

  /**
   * @brief Wait up to receive_timeout_ms for the next batch
   * @return std::nullopt on timeout or an undecodable message
   */
  std::optional<Monitor::AlertBatch> Receive();

 private:
  bool fConnected = false;
  bool fConfigured = false;
  AlertChannelConfig fConfig;

  std::unique_ptr<zmq::context_t> fContext;
  std::unique_ptr<zmq::socket_t> fSocket;
  std::shared_ptr<Logger> fLogger;
};

}  // namespace PIPEMON::Sink
