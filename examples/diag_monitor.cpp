/**
 * @file diag_monitor.cpp
 * @brief Print every DIAG packet a Qualcomm modem sends
 *
 * Resolves a device (USB interface, tty, forwarded TCP bridge or capture
 * file), sends a version request once the first packet arrives and dumps
 * every packet as hex until Ctrl+C or the device goes away.
 *
 * Usage:
 *   diag_monitor [auto | /dev/ttyUSB2 | vid:pid[:cfg:intf] | bus:addr[:cfg:intf]] [-v]
 *   diag_monitor --tcp [host[:port]] [-v]
 *   diag_monitor --replay capture.bin [-v]
 */

#include <charconv>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "diag_link/common/byte_helpers.hpp"
#include "diag_link/common/logger.hpp"
#include "diag_link/common/session_options.hpp"
#include "diag_link/session/input_session.hpp"
#include "diag_link/transport/transport_factory.hpp"
#include "diag_link/usb/device_selector.hpp"
#include "diag_link/usb/device_specifier.hpp"
#include "diag_link/usb/libusb_enumerator.hpp"
#include "diag_link/usb/usb_transport_factory.hpp"

namespace {

diaglink::InputSession *g_session = nullptr;

void HandleSignal(int) {
  if (g_session != nullptr) {
    g_session->RequestStop();
  }
}

class HexDumpModule : public diaglink::DiagModule {
 public:
  explicit HexDumpModule(diaglink::DiagSender &sender)
      : sender_(sender) {}

  void OnPacket(const diaglink::DiagPacket &packet) override {
    uint8_t type_id = packet.GetTypeId();
    std::cout << "0x" << diaglink::BytesToHex(std::span<const uint8_t>(&type_id, 1)) << " ("
              << packet.GetPayload().size() << " bytes): " << diaglink::BytesToHex(packet.GetPayload()) << "\n";
    if (!version_requested_) {
      // 0x00: version information request
      version_requested_ = sender_.SendRequest(0x00, {});
    }
  }

  void OnShutdown() override { std::cout << "Session closed\n"; }

 private:
  diaglink::DiagSender &sender_;
  bool version_requested_{false};
};

void PrintUsage(const char *program) {
  std::cerr << "Usage: " << program << " [auto|PATH|VID:PID[:CFG:INTF]|BUS:ADDR[:CFG:INTF]] [-v]\n"
            << "       " << program << " --tcp [HOST[:PORT]] [-v]\n"
            << "       " << program << " --replay FILE [-v]\n";
}

}  // namespace

int main(int argc, char **argv) {
  using diaglink::DeviceSelector;
  using diaglink::DeviceSpecifier;
  using diaglink::InputSession;
  using diaglink::LibusbEnumerator;
  using diaglink::Logger;
  using diaglink::LogLevel;
  using diaglink::OpenResult;
  using diaglink::SessionOptions;

  std::string device = "auto";
  std::string tcp_target;
  std::string replay_path;
  bool use_tcp = false;
  SessionOptions session_options;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg == "-v" || arg == "--verbose") {
      session_options.log_packets = true;
      Logger::SetLevel(LogLevel::kDebug);
    } else if (arg == "--tcp") {
      use_tcp = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        tcp_target = argv[++i];
      }
    } else if (arg == "--replay" && i + 1 < argc) {
      replay_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-') {
      device = std::string(arg);
    } else {
      PrintUsage(argv[0]);
      return 2;
    }
  }

  OpenResult opened;
  if (!replay_path.empty()) {
    opened = diaglink::OpenReplayTransport(replay_path);
  } else if (use_tcp) {
    diaglink::TcpOptions tcp_options;
    if (!tcp_target.empty()) {
      auto colon = tcp_target.rfind(':');
      tcp_options.host = tcp_target.substr(0, colon);
      if (colon != std::string::npos) {
        const char *first = tcp_target.data() + colon + 1;
        const char *last = tcp_target.data() + tcp_target.size();
        auto [end, ec] = std::from_chars(first, last, tcp_options.port);
        if (ec != std::errc() || end != last) {
          std::cerr << "Invalid TCP port in " << tcp_target << "\n";
          return 2;
        }
      }
    }
    opened = diaglink::OpenTcpTransport(tcp_options);
  } else {
    auto specifier = DeviceSpecifier::Parse(device);
    if (!specifier.has_value()) {
      std::cerr << "Invalid device specifier: " << device << "\n";
      PrintUsage(argv[0]);
      return 2;
    }

    LibusbEnumerator enumerator;
    DeviceSelector selector(enumerator);
    auto resolved = selector.Resolve(*specifier);
    if (!resolved.IsFound()) {
      auto reason = *resolved.GetNotFoundReason();
      std::cerr << "Error: " << diaglink::NotFoundReasonToString(reason) << "\n"
                << diaglink::RemediationHint(reason) << "\n";
      return 1;
    }
    opened = diaglink::OpenTransport(resolved);
  }

  if (!opened.Ok()) {
    std::cerr << "Error: " << diaglink::OpenErrorToString(opened.error) << "\n"
              << diaglink::OpenErrorHint(opened.error) << "\n";
    return 1;
  }

  InputSession session(std::move(opened.transport), session_options);
  session.AddModule(std::make_unique<HexDumpModule>(session));

  g_session = &session;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto exit = session.Run();
  g_session = nullptr;

  auto stats = session.GetStats();
  std::cout << "Exit: " << diaglink::SessionExitToString(exit) << ", " << stats.frames_dispatched
            << " packets, " << stats.frames_skipped << " skipped, " << stats.frames_degraded << " degraded\n";
  return exit == diaglink::SessionExit::kStopped ? 0 : 1;
}
