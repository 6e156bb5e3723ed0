#include "pipemon/sink/ZMQAlertPublisher.hpp"

#include "pipemon/monitor/RecordCodec.hpp"

namespace PIPEMON::Sink
{

ZMQAlertPublisher::ZMQAlertPublisher()
    : fContext(std::make_unique<zmq::context_t>(1)),
      fLogger(Logger::GetLogger("ZMQAlertPublisher"))
{
}

ZMQAlertPublisher::~ZMQAlertPublisher() { Disconnect(); }

bool ZMQAlertPublisher::IsConnected() const
{
  std::lock_guard<std::mutex> lock(fSocketMutex);
  return fConnected;
}

bool ZMQAlertPublisher::Configure(const AlertChannelConfig &config)
{
  if (config.address.empty()) {
    return false;  // Reject empty address
  }
  if (config.pattern != "PUB" && config.pattern != "PUSH") {
    return false;  // Only sending patterns
  }

  std::lock_guard<std::mutex> lock(fSocketMutex);
  fConfig = config;
  fConfigured = true;
  return true;
}

bool ZMQAlertPublisher::ConfigureFromJSON(const nlohmann::json &config)
{
  try {
    AlertChannelConfig channel;
    if (config.contains("publish_address")) {
      channel.address = config["publish_address"].get<std::string>();
    }
    if (config.contains("pattern")) {
      channel.pattern = config["pattern"].get<std::string>();
    }
    if (config.contains("bind")) {
      channel.bind = config["bind"].get<bool>();
    }
    return Configure(channel);
  } catch (const nlohmann::json::exception &e) {
    fLogger->Error(std::string("Invalid alert channel configuration: ") +
                   e.what());
    return false;
  }
}

bool ZMQAlertPublisher::Connect()
{
  std::lock_guard<std::mutex> lock(fSocketMutex);
  if (!fConfigured) {
    return false;
  }
  if (fConnected) {
    return true;
  }

  try {
    int socket_type = fConfig.pattern == "PUSH" ? ZMQ_PUSH : ZMQ_PUB;
    fSocket = std::make_unique<zmq::socket_t>(*fContext, socket_type);
    fSocket->set(zmq::sockopt::linger, 0);

    if (fConfig.bind) {
      fSocket->bind(fConfig.address);
    } else {
      fSocket->connect(fConfig.address);
    }

    fConnected = true;
    fLogger->Info("Alert publisher " + fConfig.pattern + " on " +
                  fConfig.address);
    return true;

  } catch (const zmq::error_t &e) {
    fLogger->Error("Failed to open alert channel " + fConfig.address + ": " +
                   e.what());
    fConnected = false;
    fSocket.reset();
    return false;
  }
}

void ZMQAlertPublisher::Disconnect()
{
  std::lock_guard<std::mutex> lock(fSocketMutex);
  if (fSocket) {
    fSocket->close();
    fSocket.reset();
  }
  fConnected = false;
}

Status ZMQAlertPublisher::SendAlert(const Monitor::AlertBatch &batch)
{
  std::string payload;
  try {
    payload = nlohmann::json(batch).dump();
  } catch (const nlohmann::json::exception &e) {
    return Status{Error(Error::SERIALIZATION_ERROR,
                        std::string("Failed to encode alert: ") + e.what())};
  }

  std::lock_guard<std::mutex> lock(fSocketMutex);
  if (!fConnected || !fSocket) {
    return Status{Error(Error::TRANSPORT_ERROR, "Alert channel not connected")};
  }

  try {
    zmq::message_t message(payload.data(), payload.size());
    auto result = fSocket->send(message, zmq::send_flags::dontwait);
    if (!result) {
      return Status{
          Error(Error::TRANSPORT_ERROR, "Alert send would block (no peer?)")};
    }
  } catch (const zmq::error_t &e) {
    return Status{Error(Error::TRANSPORT_ERROR,
                        std::string("Alert send failed: ") + e.what(),
                        e.num())};
  }

  ++fSentCount;
  return OkStatus();
}

// === ZMQAlertSubscriber ===

ZMQAlertSubscriber::ZMQAlertSubscriber()
    : fContext(std::make_unique<zmq::context_t>(1)),
      fLogger(Logger::GetLogger("ZMQAlertSubscriber"))
{
}

ZMQAlertSubscriber::~ZMQAlertSubscriber() { Disconnect(); }

bool ZMQAlertSubscriber::Configure(const AlertChannelConfig &config)
{
  if (config.address.empty()) {
    return false;
  }
  if (config.pattern != "SUB" && config.pattern != "PULL") {
    return false;  // Only receiving patterns
  }
  fConfig = config;
  fConfigured = true;
  return true;
}

bool ZMQAlertSubscriber::Connect()
{
  if (!fConfigured) {
    return false;
  }

  try {
    int socket_type = fConfig.pattern == "PULL" ? ZMQ_PULL : ZMQ_SUB;
    fSocket = std::make_unique<zmq::socket_t>(*fContext, socket_type);
    if (socket_type == ZMQ_SUB) {
      fSocket->set(zmq::sockopt::subscribe, "");  // Accept all messages
    }
    fSocket->set(zmq::sockopt::rcvtimeo, fConfig.receive_timeout_ms);
    fSocket->set(zmq::sockopt::linger, 0);

    if (fConfig.bind) {
      fSocket->bind(fConfig.address);
    } else {
      fSocket->connect(fConfig.address);
    }
    fConnected = true;
    return true;

  } catch (const zmq::error_t &e) {
    fLogger->Error("Failed to open alert subscription " + fConfig.address +
                   ": " + e.what());
    fConnected = false;
    fSocket.reset();
    return false;
  }
}

void ZMQAlertSubscriber::Disconnect()
{
  if (fSocket) {
    fSocket->close();
    fSocket.reset();
  }
  fConnected = false;
}

std::optional<Monitor::AlertBatch> ZMQAlertSubscriber::Receive()
{
  if (!fConnected || !fSocket) {
    return std::nullopt;
  }

  zmq::message_t message;
  try {
    auto result = fSocket->recv(message, zmq::recv_flags::none);
    if (!result) {
      return std::nullopt;  // Timeout
    }
  } catch (const zmq::error_t &e) {
    fLogger->Error(std::string("Alert receive failed: ") + e.what());
    return std::nullopt;
  }

  try {
    auto document = nlohmann::json::parse(std::string(
        static_cast<const char *>(message.data()), message.size()));
    return document.get<Monitor::AlertBatch>();
  } catch (const nlohmann::json::exception &e) {
    fLogger->Warning(std::string("Discarding malformed alert: ") + e.what());
  } catch (const std::invalid_argument &e) {
    fLogger->Warning(std::string("Discarding malformed alert: ") + e.what());
  }
  return std::nullopt;
}

}  // namespace PIPEMON::Sink
