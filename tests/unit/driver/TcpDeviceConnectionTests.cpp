#include <gtest/gtest.h>

#include <DeviceErrors.hpp>
#include <TcpDeviceConnection.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {
// Loopback peer for a single client. For every step it reads one frame,
// waits `delay` and answers with `reply`, then closes the client.
class LoopbackPeer {
 public:
  struct Step {
    std::chrono::milliseconds delay{0};
    std::string reply;
  };

  explicit LoopbackPeer(std::vector<Step> script) : _script(std::move(script)) {
    _listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (_listenFd < 0 ||
        ::bind(_listenFd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(_listenFd, 1) != 0) {
      throw std::runtime_error("loopback peer setup failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(_listenFd, reinterpret_cast<sockaddr*>(&addr), &len);
    _port = ntohs(addr.sin_port);
    _thread = std::thread([this] { serve(); });
  }

  explicit LoopbackPeer(std::string reply)
      : LoopbackPeer(std::vector<Step>{{.reply = std::move(reply)}}) {}

  ~LoopbackPeer() {
    if (_thread.joinable()) {
      _thread.join();
    }
    ::close(_listenFd);
  }

  [[nodiscard]] std::string port() const { return std::to_string(_port); }
  [[nodiscard]] const std::vector<std::string>& received() const {
    return _received;
  }
  void join() { _thread.join(); }

 private:
  void serve() {
    const int client = ::accept(_listenFd, nullptr, nullptr);
    if (client < 0) {
      return;
    }
    std::string buffered;
    for (const auto& step : _script) {
      std::size_t eol = std::string::npos;
      while ((eol = buffered.find('\n')) == std::string::npos) {
        char chunk[256];
        const auto n = ::recv(client, chunk, sizeof(chunk), 0);
        if (n <= 0) {
          ::close(client);
          return;
        }
        buffered.append(chunk, static_cast<std::size_t>(n));
      }
      _received.push_back(buffered.substr(0, eol + 1));
      buffered.erase(0, eol + 1);
      std::this_thread::sleep_for(step.delay);
      ::send(client, step.reply.data(), step.reply.size(), MSG_NOSIGNAL);
    }
    ::close(client);
  }

  std::vector<Step> _script;
  std::vector<std::string> _received;
  int _listenFd{-1};
  unsigned short _port{0};
  std::thread _thread;
};

ConnectionParameters tcpParams(std::string host, std::string port) {
  ConnectionParameters params;
  params.address = std::move(host);
  params.port = std::move(port);
  params.readTimeoutMS = 500;
  return params;
}
}  // namespace

TEST(TcpDeviceConnectionTests, DescribeNamesHostAndPort) {
  TcpDeviceConnection conn(tcpParams("10.0.0.7", "4001"));
  EXPECT_EQ(conn.describe(), "tcp(10.0.0.7:4001)");
  EXPECT_FALSE(conn.isOpen());
}

TEST(TcpDeviceConnectionTests, MissingAddressThrows) {
  ConnectionParameters params;
  params.port = "4001";
  EXPECT_THROW(TcpDeviceConnection{params}, std::runtime_error);
}

TEST(TcpDeviceConnectionTests, InvalidPortThrows) {
  for (const auto* port : {"", "0", "65536", "telnet", "40a"}) {
    EXPECT_THROW(TcpDeviceConnection{tcpParams("localhost", port)},
                 std::runtime_error)
        << port;
  }
}

TEST(TcpDeviceConnectionTests, UnsupportedEncodingThrows) {
  auto params = tcpParams("localhost", "4001");
  params.encoding = "latin-1";
  EXPECT_THROW(TcpDeviceConnection{params}, std::runtime_error);
}

TEST(TcpDeviceConnectionTests, IoOnClosedSocketIsConnectionError) {
  TcpDeviceConnection conn(tcpParams("127.0.0.1", "4001"));
  EXPECT_THROW(conn.write("STATUS\r\n"), ConnectionError);
  EXPECT_THROW((void)conn.readUntil("\r\n"), ConnectionError);
}

TEST(TcpDeviceConnectionTests, NonAsciiFrameRejectedInStrictMode) {
  TcpDeviceConnection conn(tcpParams("127.0.0.1", "4001"));
  EXPECT_THROW(conn.write("OUT_SP_1 \xC2\xB0\r\n"), InvalidArgument);
}

TEST(TcpDeviceConnectionTests, RefusedConnectionIsConnectionError) {
  std::string port;
  {
    // Grab a free port, then release it so nothing listens there.
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = std::to_string(ntohs(addr.sin_port));
    ::close(fd);
  }

  TcpDeviceConnection conn(tcpParams("127.0.0.1", port));
  EXPECT_THROW(conn.open(), ConnectionError);
  EXPECT_FALSE(conn.isOpen());
}

TEST(TcpDeviceConnectionTests, ExchangesOneLineWithPeer) {
  LoopbackPeer peer("IN_PV_3 \xB2" "5.0\r\n");
  TcpDeviceConnection conn(tcpParams("127.0.0.1", peer.port()));

  conn.open();
  ASSERT_TRUE(conn.isOpen());
  conn.write("IN_PV_3\r\n");
  // Bit 7 is masked off in strict 7-bit mode.
  EXPECT_EQ(conn.readUntil("\r\n"), "IN_PV_3 25.0");
  peer.join();
  ASSERT_EQ(peer.received().size(), 1u);
  EXPECT_EQ(peer.received().front(), "IN_PV_3\r\n");

  conn.closeNoThrow();
  EXPECT_FALSE(conn.isOpen());
}

TEST(TcpDeviceConnectionTests, LateReplyIsNotReturnedToNextExchange) {
  LoopbackPeer peer({{.delay = 300ms, .reply = "STATUS 2\r\n"},
                     {.delay = 0ms, .reply = "STATUS 1\r\n"}});
  auto params = tcpParams("127.0.0.1", peer.port());
  params.readTimeoutMS = 100;
  TcpDeviceConnection conn(params);

  conn.open();
  conn.write("STATUS\r\n");
  EXPECT_THROW((void)conn.readUntil("\r\n"), ConnectionError);

  // The first reply lands in the socket after the timeout.
  std::this_thread::sleep_for(400ms);
  conn.write("STATUS\r\n");
  EXPECT_EQ(conn.readUntil("\r\n"), "STATUS 1");
}

TEST(TcpDeviceConnectionTests, PeerClosingBeforeTerminatorIsConnectionError) {
  LoopbackPeer peer("IN_PV_3 25");
  TcpDeviceConnection conn(tcpParams("127.0.0.1", peer.port()));

  conn.open();
  conn.write("IN_PV_3\r\n");
  EXPECT_THROW((void)conn.readUntil("\r\n"), ConnectionError);
}
