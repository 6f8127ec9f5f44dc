/**
 * @file simulated_apsyn420.cpp
 * @brief Minimal APSYN420 stand-in speaking raw SCPI over TCP
 *
 * Serves the commands the driver uses (FREQ, OUTP, OUTP:BLAN, PULM:*, ROSC:*, *RST, *IDN?)
 * and answers queries with a newline-terminated reply. ROSC:LOCK? reports 0 a few
 * times after ROSC:SOUR EXT before reporting 1.
 *
 * Usage:
 *   ./simulated_apsyn420 [bind_address] [port]
 *
 * Example:
 *   ./simulated_apsyn420 127.0.0.1 5025
 *   ./example_apsyn420 127.0.0.1:5025 2.5e9 --external-ref
 */

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <span>
#include <string>
#include <thread>
#include <fmt/format.h>
#include "apsyn/common/log.hpp"
#include "apsyn/common/response_parsers.hpp"
#include "apsyn/transport/tcp_transport.hpp"

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

using apsyn::NormalizeToken;
using apsyn::TcpTransport;

volatile std::sig_atomic_t g_running = 1;

void signal_handler([[maybe_unused]] int signal) {
  g_running = 0;
}

namespace {

constexpr int kLockPolls = 3;

int TcpListen(const std::string &bind_address, uint16_t port) {
#ifdef __linux__
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }

  int opt = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
    ::close(fd);
    return -1;
  }

  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (bind_address.empty() || bind_address == "0.0.0.0") {
    addr.sin_addr.s_addr = INADDR_ANY;
  } else if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) <= 0) {
    ::close(fd);
    return -1;
  }

  if (::bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
#else
  (void)bind_address;
  (void)port;
  return -1;
#endif
}

class SimulatedGenerator {
 public:
  SimulatedGenerator() { Reset(); }

  /**
   * @brief Apply one command line; returns the reply for queries, empty otherwise
   */
  std::string Handle(const std::string &line) {
    std::string text = std::string(apsyn::Trim(line));
    size_t space = text.find(' ');
    std::string header = NormalizeToken(text.substr(0, space));
    std::string argument = space == std::string::npos ? "" : std::string(apsyn::Trim(text.substr(space + 1)));

    if (header == "*RST") {
      Reset();
      return {};
    }
    if (header == "*IDN?") {
      return "AnaPico AG,APSYN420,SIM0001,0.1";
    }
    if (header == "ROSC:LOCK?") {
      if (settings_["ROSC:SOUR"] != "EXT") {
        return "1";
      }
      return lock_polls_remaining_-- > 0 ? "0" : "1";
    }
    if (header.ends_with('?')) {
      auto it = settings_.find(header.substr(0, header.size() - 1));
      return it == settings_.end() ? "0" : it->second;
    }
    if (header == "ROSC:SOUR") {
      lock_polls_remaining_ = kLockPolls;
      argument = NormalizeToken(argument);
    }
    if (header == "FREQ") {
      auto value = apsyn::ParseDouble(argument);
      if (!value.has_value()) {
        apsyn::Logger()->warn("Ignoring bad frequency '{}'", argument);
        return {};
      }
      argument = fmt::format("{:.3f}", *value);
    }
    settings_[header] = argument;
    return {};
  }

 private:
  void Reset() {
    settings_ = {{"FREQ", "1000000000.000"}, {"OUTP", "0"},          {"OUTP:BLAN", "0"},
                 {"PULM:STAT", "0"},         {"PULM:POL", "NORM"},   {"PULM:SOUR", "INT"},
                 {"PULM:INT:PER", "1.0e-3"}, {"PULM:INT:PWID", "1.0e-6"}, {"ROSC:SOUR", "INT"}};
    lock_polls_remaining_ = 0;
  }

  std::map<std::string, std::string> settings_{};
  int lock_polls_remaining_{0};
};

void Serve(TcpTransport &transport, SimulatedGenerator &generator) {
  std::string buffer;
  while (g_running && transport.IsOpen()) {
    uint8_t temp[256];
    int n = transport.Read(std::span<uint8_t>(temp, sizeof(temp)));
    if (n < 0) {
      return;
    }
    if (n == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    buffer.append(reinterpret_cast<char *>(temp), static_cast<size_t>(n));

    size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
      std::string line = buffer.substr(0, newline);
      buffer.erase(0, newline + 1);
      apsyn::Logger()->info("<- {}", apsyn::Trim(line));
      std::string reply = generator.Handle(line);
      if (reply.empty()) {
        continue;
      }
      apsyn::Logger()->info("-> {}", reply);
      reply += '\n';
      int written = transport.Write({reinterpret_cast<const uint8_t *>(reply.data()), reply.size()});
      if (written != static_cast<int>(reply.size())) {
        apsyn::Logger()->warn("Reply write failed with code {}", written);
        return;
      }
    }
  }
}

}  // namespace

int main(int argc, const char *argv[]) {
  if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    std::cerr << "Usage: " << argv[0] << " [bind_address] [port]\n";
    std::cerr << "  bind_address  Address to bind (default: 127.0.0.1)\n";
    std::cerr << "  port          TCP port (default: 5025)\n";
    return 0;
  }

  const std::string bind_address = (argc >= 2) ? argv[1] : "127.0.0.1";
  const uint16_t port = (argc >= 3) ? static_cast<uint16_t>(std::atoi(argv[2])) : 5025;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

#ifdef __linux__
  int listen_fd = TcpListen(bind_address, port);
  if (listen_fd < 0) {
    std::cerr << "Error: Failed to listen on " << bind_address << ":" << port << "\n";
    return 1;
  }
  apsyn::Logger()->info("Simulated APSYN420 listening on {}:{}", bind_address, port);

  SimulatedGenerator generator;
  while (g_running) {
    int client_fd = ::accept(listen_fd, nullptr, nullptr);
    if (client_fd < 0) {
      continue;
    }
    apsyn::Logger()->info("Client connected");
    TcpTransport transport(client_fd);
    Serve(transport, generator);
    apsyn::Logger()->info("Client disconnected");
  }
  ::close(listen_fd);
  return 0;
#else
  std::cerr << "The simulator needs POSIX sockets\n";
  return 1;
#endif
}
