/**
 * @file alert_listener_main.cpp
 * @brief Prints SLO alert batches received from a PipeMon alert channel
 *
 * Usage:
 *   pipemon_alert_listener [options]
 *
 * Options:
 *   -a, --address <address>  Alert channel address (default: tcp://localhost:5590)
 *   --pull                   Use PULL instead of SUB (publisher uses PUSH)
 *   --bind                   Bind instead of connect
 *   --json                   Print the raw JSON batch instead of the text
 *   -h, --help               Show this help message
 *
 * Example:
 *   pipemon_alert_listener -a tcp://localhost:5590
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "pipemon/monitor/RecordCodec.hpp"
#include "pipemon/sink/ZMQAlertPublisher.hpp"

using namespace PIPEMON;

static std::atomic<bool> g_running{true};

void signalHandler(int signum)
{
  (void)signum;
  g_running = false;
}

void printUsage(const char *program)
{
  std::cout << "PipeMon Alert Listener\n\n";
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -a, --address <address>  Alert channel address (default: tcp://localhost:5590)\n";
  std::cout << "  --pull                   Use PULL instead of SUB\n";
  std::cout << "  --bind                   Bind instead of connect\n";
  std::cout << "  --json                   Print the raw JSON batch\n";
  std::cout << "  -h, --help               Show this help message\n";
}

int main(int argc, char *argv[])
{
  Sink::AlertChannelConfig channel;
  channel.address = "tcp://localhost:5590";
  channel.pattern = "SUB";
  channel.bind = false;
  channel.receive_timeout_ms = 500;
  bool print_json = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-a" || arg == "--address") {
      if (i + 1 < argc) {
        channel.address = argv[++i];
      }
    } else if (arg == "--pull") {
      channel.pattern = "PULL";
    } else if (arg == "--bind") {
      channel.bind = true;
    } else if (arg == "--json") {
      print_json = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  Sink::ZMQAlertSubscriber subscriber;
  if (!subscriber.Configure(channel) || !subscriber.Connect()) {
    std::cerr << "ERROR: Failed to open alert channel " << channel.address
              << std::endl;
    return 1;
  }

  std::cout << "Listening for SLO alerts on " << channel.address << " ("
            << channel.pattern << ")" << std::endl;

  uint64_t received = 0;
  while (g_running) {
    auto batch = subscriber.Receive();
    if (!batch) {
      continue;
    }
    ++received;
    if (print_json) {
      nlohmann::json j = *batch;
      std::cout << j.dump() << std::endl;
    } else {
      std::cout << batch->text << "\n" << std::endl;
    }
  }

  subscriber.Disconnect();
  std::cout << "Received " << received << " alert batches" << std::endl;
  return 0;
}
