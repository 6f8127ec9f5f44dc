#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include "apsyn/common/connection_options.hpp"
#include "apsyn/common/status.hpp"
#include "apsyn/session/scpi_session.hpp"
#include "apsyn/transport/tcp_transport.hpp"
#include "common/scripted_transport.hpp"

using apsyn::ConnectionMode;
using apsyn::ConnectionOptions;
using apsyn::ErrorKind;
using apsyn::ScpiSession;
using apsyn::Status;
using apsyn::test::ScriptedTransportFactory;

namespace {

ConnectionOptions PerCommandOptions() {
  ConnectionOptions options;
  options.name = "apsyn";
  options.mode = ConnectionMode::PerCommand;
  options.read_timeout_ms = 10;
  return options;
}

ConnectionOptions PersistentOptions() {
  ConnectionOptions options = PerCommandOptions();
  options.mode = ConnectionMode::Persistent;
  return options;
}

// Serves each reply in pieces: every Read() returns the next chunk, an empty chunk is a read with
// nothing available yet. A write containing '?' queues the next reply's chunks.
struct ChunkScript {
  std::deque<std::string> pending{};
  std::deque<std::vector<std::string>> replies{};
};

class ChunkedTransport : public apsyn::ByteTransport {
 public:
  explicit ChunkedTransport(ChunkScript &script)
      : script_(script) {}

  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (script_.pending.empty()) {
      return 0;
    }
    std::string chunk = script_.pending.front();
    script_.pending.pop_front();
    size_t count = std::min(chunk.size(), buffer.size());
    std::copy_n(chunk.begin(), count, buffer.begin());
    return static_cast<int>(count);
  }

  [[nodiscard]] bool HasData() const override {
    return !script_.pending.empty() && !script_.pending.front().empty();
  }

  [[nodiscard]] size_t AvailableBytes() const override {
    return HasData() ? script_.pending.front().size() : 0;
  }

  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    std::string text(data.begin(), data.end());
    if (text.find('?') != std::string::npos && !script_.replies.empty()) {
      for (auto &chunk : script_.replies.front()) {
        script_.pending.push_back(std::move(chunk));
      }
      script_.replies.pop_front();
    }
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return true; }

 private:
  ChunkScript &script_;
};

class ChunkedTransportFactory : public apsyn::TransportFactory {
 public:
  [[nodiscard]] std::unique_ptr<apsyn::ByteTransport> Open(std::string_view) override {
    return std::make_unique<ChunkedTransport>(script);
  }

  ChunkScript script{};
};

// Hands out one end of a connected socket pair, once
class SocketPairFactory : public apsyn::TransportFactory {
 public:
  explicit SocketPairFactory(int fd)
      : fd_(fd) {}

  [[nodiscard]] std::unique_ptr<apsyn::ByteTransport> Open(std::string_view) override {
    if (fd_ < 0) {
      return nullptr;
    }
    return std::make_unique<apsyn::TcpTransport>(std::exchange(fd_, -1));
  }

 private:
  int fd_;
};

// Blocks until one command line has arrived on the instrument end
std::string ReadCommandLine(int fd) {
  std::string line;
  char c = 0;
  while (::read(fd, &c, 1) == 1) {
    line += c;
    if (line.ends_with("\r\n")) {
      break;
    }
  }
  return line;
}

}  // namespace

TEST(ScpiSession, PerCommandSendOpensWritesAndCloses) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PerCommandOptions());
  EXPECT_EQ(factory.script.opens, 0);

  Status status = session.Send("OUTP 1");
  EXPECT_TRUE(status.Ok());
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 1);
  EXPECT_FALSE(session.IsConnected());
  EXPECT_EQ(factory.script.log, (std::vector<std::string>{"open(A)", "write(OUTP 1\r\n)", "close()"}));
}

TEST(ScpiSession, PerCommandSendClosesOnWriteError) {
  ScriptedTransportFactory factory;
  factory.script.write_error = -5;
  ScpiSession session(factory, "A", PerCommandOptions());

  Status status = session.Send("FREQ 1000000000.000");
  EXPECT_EQ(status.kind, ErrorKind::kCommandFailure);
  EXPECT_EQ(status.device_code, -5);
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 1);
  EXPECT_FALSE(session.IsConnected());
}

TEST(ScpiSession, PerCommandSendEveryCallBalanced) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PerCommandOptions());

  for (int i = 1; i <= 3; ++i) {
    EXPECT_TRUE(session.Send("OUTP 0").Ok());
    EXPECT_EQ(factory.script.opens, i);
    EXPECT_EQ(factory.script.closes, i);
  }
}

TEST(ScpiSession, PerCommandQueryLeavesConnectionOpen) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("1\n");
  ScpiSession session(factory, "A", PerCommandOptions());

  std::string response;
  Status status = session.Query("OUTP?", response);
  EXPECT_TRUE(status.Ok());
  EXPECT_EQ(response, "1\n");
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 0);
  EXPECT_TRUE(session.IsConnected());
}

TEST(ScpiSession, PerCommandQueryClosesWhenConfigured) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("1\n");
  ConnectionOptions options = PerCommandOptions();
  options.close_after_query = true;
  ScpiSession session(factory, "A", options);

  std::string response;
  EXPECT_TRUE(session.Query("OUTP?", response).Ok());
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 1);
  EXPECT_FALSE(session.IsConnected());
}

TEST(ScpiSession, SendThenQuerySequence) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("1");
  ScpiSession session(factory, "A", PerCommandOptions());

  EXPECT_TRUE(session.Send("OUTP 1").Ok());
  std::string response;
  EXPECT_TRUE(session.Query("OUTP?", response).Ok());
  EXPECT_EQ(response, "1");

  std::vector<std::string> expected{"open(A)", "write(OUTP 1\r\n)", "close()", "open(A)", "write(OUTP?\r\n)"};
  EXPECT_EQ(factory.script.log, expected);
}

TEST(ScpiSession, SendAfterQueryReusesAndClosesConnection) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("0");
  ScpiSession session(factory, "A", PerCommandOptions());

  std::string response;
  EXPECT_TRUE(session.Query("OUTP?", response).Ok());
  EXPECT_TRUE(session.Send("OUTP 1").Ok());

  std::vector<std::string> expected{"open(A)", "write(OUTP?\r\n)", "write(OUTP 1\r\n)", "close()"};
  EXPECT_EQ(factory.script.log, expected);
  EXPECT_FALSE(session.IsConnected());
}

TEST(ScpiSession, PersistentOpensOnceAtConstruction) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("2.5e9");
  {
    ScpiSession session(factory, "A", PersistentOptions());
    EXPECT_EQ(factory.script.opens, 1);
    EXPECT_TRUE(session.IsConnected());

    EXPECT_TRUE(session.Send("FREQ 2500000000.000").Ok());
    std::string response;
    EXPECT_TRUE(session.Query("FREQ?", response).Ok());
    EXPECT_EQ(response, "2.5e9");
    EXPECT_TRUE(session.Send("OUTP 1").Ok());

    EXPECT_EQ(factory.script.opens, 1);
    EXPECT_EQ(factory.script.closes, 0);
  }
  EXPECT_EQ(factory.script.closes, 1);
}

TEST(ScpiSession, OpenFailureIsConnectionFailed) {
  ScriptedTransportFactory factory;
  factory.script.fail_open = true;
  ScpiSession session(factory, "A", PerCommandOptions());

  EXPECT_EQ(session.Send("OUTP 1").kind, ErrorKind::kConnectionFailed);
  std::string response;
  EXPECT_EQ(session.Query("OUTP?", response).kind, ErrorKind::kConnectionFailed);
  EXPECT_EQ(factory.script.closes, 0);
}

TEST(ScpiSession, PersistentRetriesOpenAfterFailedConstruction) {
  ScriptedTransportFactory factory;
  factory.script.fail_open = true;
  ScpiSession session(factory, "A", PersistentOptions());
  EXPECT_FALSE(session.IsConnected());

  factory.script.fail_open = false;
  EXPECT_TRUE(session.Send("OUTP 1").Ok());
  EXPECT_TRUE(session.IsConnected());
  EXPECT_EQ(factory.script.opens, 2);
}

TEST(ScpiSession, QueryWithoutReplyTimesOut) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PerCommandOptions());

  std::string response;
  EXPECT_EQ(session.Query("FREQ?", response).kind, ErrorKind::kTimeout);
}

TEST(ScpiSession, ReadTerminationIsStripped) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("NORM\n");
  ConnectionOptions options = PerCommandOptions();
  options.read_termination = "\n";
  ScpiSession session(factory, "A", options);

  std::string response;
  EXPECT_TRUE(session.Query("PULM:POL?", response).Ok());
  EXPECT_EQ(response, "NORM");
}

TEST(ScpiSession, ReadTerminationMissingTimesOut) {
  ScriptedTransportFactory factory;
  factory.script.replies.push_back("NORM");
  ConnectionOptions options = PerCommandOptions();
  options.read_termination = "\n";
  ScpiSession session(factory, "A", options);

  std::string response;
  EXPECT_EQ(session.Query("PULM:POL?", response).kind, ErrorKind::kTimeout);
}

TEST(ScpiSession, MalformedCommandsAreRejectedWithoutOpening) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PerCommandOptions());

  EXPECT_EQ(session.Send("").kind, ErrorKind::kValidationFailure);
  EXPECT_EQ(session.Send("OUTP 1\r\nOUTP 0").kind, ErrorKind::kValidationFailure);
  std::string response;
  EXPECT_EQ(session.Query("", response).kind, ErrorKind::kValidationFailure);
  EXPECT_EQ(factory.script.opens, 0);
}

TEST(ScpiSession, ModeSwitching) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PerCommandOptions());
  EXPECT_EQ(session.Mode(), ConnectionMode::PerCommand);

  session.EnablePerCommandMode();
  EXPECT_EQ(session.Mode(), ConnectionMode::PerCommand);

  session.EnablePersistentMode();
  EXPECT_EQ(session.Mode(), ConnectionMode::Persistent);
  EXPECT_TRUE(session.Send("OUTP 1").Ok());
  EXPECT_TRUE(session.Send("OUTP 0").Ok());
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 0);

  session.EnablePersistentMode();
  EXPECT_EQ(session.Mode(), ConnectionMode::Persistent);

  // The open connection is reused once more, then closed
  session.EnablePerCommandMode();
  EXPECT_TRUE(session.Send("OUTP 1").Ok());
  EXPECT_EQ(factory.script.opens, 1);
  EXPECT_EQ(factory.script.closes, 1);
}

TEST(ScpiSession, CloseReleasesConnection) {
  ScriptedTransportFactory factory;
  ScpiSession session(factory, "A", PersistentOptions());
  session.Close();
  EXPECT_FALSE(session.IsConnected());
  EXPECT_EQ(factory.script.closes, 1);
  session.Close();
  EXPECT_EQ(factory.script.closes, 1);
}

TEST(ScpiSession, TerminatedReplySplitAcrossReads) {
  ChunkedTransportFactory factory;
  factory.script.replies.push_back({"2490", "", "236.000\n"});
  ConnectionOptions options = PersistentOptions();
  options.read_termination = "\n";
  ScpiSession session(factory, "A", options);

  std::string response;
  EXPECT_TRUE(session.Query("FREQ?", response).Ok());
  EXPECT_EQ(response, "2490236.000");
}

TEST(ScpiSession, UnterminatedReplyWaitsForQuietLine) {
  ChunkedTransportFactory factory;
  factory.script.replies.push_back({"2490", "", "236.000"});
  ConnectionOptions options = PersistentOptions();
  options.read_idle_ms = 50;
  ScpiSession session(factory, "A", options);

  std::string response;
  EXPECT_TRUE(session.Query("FREQ?", response).Ok());
  EXPECT_EQ(response, "2490236.000");
}

TEST(ScpiSession, StaleInputIsDiscardedBeforeQuery) {
  ChunkedTransportFactory factory;
  factory.script.replies.push_back({"1\n"});
  ConnectionOptions options = PersistentOptions();
  options.read_termination = "\n";
  ScpiSession session(factory, "A", options);
  factory.script.pending = {"236.000\n"};

  std::string response;
  EXPECT_TRUE(session.Query("OUTP?", response).Ok());
  EXPECT_EQ(response, "1");
  EXPECT_TRUE(factory.script.pending.empty());
}

TEST(ScpiSession, ReplyDelayedOnSocketIsReadWhole) {
  int fds[2]{-1, -1};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  SocketPairFactory factory(fds[0]);
  ConnectionOptions options = PersistentOptions();
  options.read_timeout_ms = 1000;
  options.read_termination = "\n";
  ScpiSession session(factory, "A", options);
  ASSERT_TRUE(session.IsConnected());

  std::thread instrument([fd = fds[1]] {
    EXPECT_EQ(ReadCommandLine(fd), "FREQ?\r\n");
    EXPECT_EQ(::write(fd, "2490", 4), 4);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(::write(fd, "236.000\n", 8), 8);
    EXPECT_EQ(ReadCommandLine(fd), "OUTP?\r\n");
    EXPECT_EQ(::write(fd, "1\n", 2), 2);
  });

  std::string frequency;
  std::string output;
  Status first = session.Query("FREQ?", frequency);
  Status second = session.Query("OUTP?", output);
  instrument.join();
  ::close(fds[1]);

  EXPECT_TRUE(first.Ok());
  EXPECT_EQ(frequency, "2490236.000");
  EXPECT_TRUE(second.Ok());
  EXPECT_EQ(output, "1");
}
