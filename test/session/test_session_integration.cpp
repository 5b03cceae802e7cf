#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>
#include "diag_link/hdlc/hdlc_frame.hpp"
#include "diag_link/session/input_session.hpp"
#include "diag_link/transport/tcp_transport.hpp"
#include "diag_link/transport/transport_factory.hpp"

using diaglink::DiagModule;
using diaglink::DiagPacket;
using diaglink::DiagSender;
using diaglink::HdlcFrame;
using diaglink::InputSession;
using diaglink::OpenReplayTransport;
using diaglink::SessionExit;
using diaglink::TcpTransport;

namespace {

class CollectingModule : public DiagModule {
 public:
  void OnPacket(const DiagPacket &packet) override { packets.push_back(packet); }
  void OnShutdown() override { shut_down = true; }

  std::vector<DiagPacket> packets;
  bool shut_down{false};
};

// Sends a version request on the first packet, like a module probing the modem
class VersionRequester : public DiagModule {
 public:
  explicit VersionRequester(DiagSender &sender)
      : sender_(sender) {}

  void OnPacket(const DiagPacket &) override {
    if (!sent_) {
      sent_ = sender_.SendRequest(0x00, {});
    }
  }

 private:
  DiagSender &sender_;
  bool sent_{false};
};

std::vector<uint8_t> Frame(uint8_t type_id, std::vector<uint8_t> payload) {
  return HdlcFrame::Encode(type_id, payload);
}

}  // namespace

TEST(SessionIntegration, ReplaysCaptureFile) {
  char path[] = "/tmp/diag_link_capture_XXXXXX";
  int fd = ::mkstemp(path);
  ASSERT_GE(fd, 0);

  // Starts mid-frame, then three complete frames, one with a bad CRC
  std::vector<uint8_t> capture{0x12, 0x34, 0x7E};
  for (const auto &frame : {Frame(0x01, {'A'}), Frame(0x10, {0x7E, 0x7D, 0x00}), Frame(0x02, {'B', 'C'})}) {
    capture.insert(capture.end(), frame.begin(), frame.end());
  }
  capture[capture.size() - 2] ^= 0xFF;
  ASSERT_EQ(::write(fd, capture.data(), capture.size()), static_cast<ssize_t>(capture.size()));
  ::close(fd);

  auto opened = OpenReplayTransport(path);
  ASSERT_TRUE(opened.Ok());
  InputSession session(std::move(opened.transport));
  auto &collector = static_cast<CollectingModule &>(session.AddModule(std::make_unique<CollectingModule>()));

  EXPECT_EQ(session.Run(), SessionExit::kReadFailed);
  ::unlink(path);

  ASSERT_EQ(collector.packets.size(), 3);
  EXPECT_EQ(collector.packets[0], DiagPacket(0x01, {'A'}));
  EXPECT_EQ(collector.packets[1], DiagPacket(0x10, {0x7E, 0x7D, 0x00}));
  EXPECT_EQ(collector.packets[2].GetTypeId(), 0x02);
  EXPECT_TRUE(collector.shut_down);

  auto stats = session.GetStats();
  EXPECT_EQ(stats.frames_skipped, 1);
  EXPECT_EQ(stats.frames_degraded, 1);
}

TEST(SessionIntegration, BridgeRequestAndResponse) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  int modem = fds[1];

  InputSession session(std::make_unique<TcpTransport>(fds[0], 20));
  auto &collector = static_cast<CollectingModule &>(session.AddModule(std::make_unique<CollectingModule>()));
  session.AddModule(std::make_unique<VersionRequester>(session));

  std::thread reader([&session] { (void)session.Run(); });

  auto event = Frame(0x60, {0x01, 0x02});
  ASSERT_EQ(::write(modem, event.data(), event.size()), static_cast<ssize_t>(event.size()));

  // The requester answers the first packet with a version request
  std::vector<uint8_t> request(16);
  ssize_t n = ::read(modem, request.data(), request.size());
  ASSERT_EQ(n, 4);
  request.resize(4);
  EXPECT_EQ(request, (std::vector<uint8_t>{0x00, 0x78, 0xF0, 0x7E}));

  auto response = Frame(0x00, {'v', '1'});
  ASSERT_EQ(::write(modem, response.data(), response.size()), static_cast<ssize_t>(response.size()));

  for (int attempt = 0; attempt < 100 && session.GetStats().frames_dispatched < 2; ++attempt) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  session.RequestStop();
  reader.join();
  ::close(modem);

  ASSERT_EQ(collector.packets.size(), 2);
  EXPECT_EQ(collector.packets[0].GetTypeId(), 0x60);
  EXPECT_EQ(collector.packets[1], DiagPacket(0x00, {'v', '1'}));
  EXPECT_TRUE(session.IsShutDown());
}

TEST(SessionIntegration, ModemHangupEndsSession) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  InputSession session(std::make_unique<TcpTransport>(fds[0], 20));
  ::close(fds[1]);

  EXPECT_EQ(session.Run(), SessionExit::kReadFailed);
  EXPECT_FALSE(session.SendRequest(0x00, {}));
}
