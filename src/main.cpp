#include "harness/config.hpp"
#include "harness/synthetic_node.hpp"
#include "network/tag.hpp"
#include "util/logging.hpp"
#include "util/random.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <set>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) {
  // write() is async-signal-safe, std::cout is not
  const char *msg = "\nReceived signal\n";
  ssize_t ignored = write(STDOUT_FILENO, msg, 17);
  (void)ignored;
  g_shutdown_requested = true;
}

std::vector<std::string> SplitList(const std::string &list) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= list.length()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) {
      if (pos < list.length()) {
        out.push_back(list.substr(pos));
      }
      break;
    }
    out.push_back(list.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

} // namespace

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Connection (one of):\n"
      << "  --connect=<ip:port>       Connect to an algod gossip endpoint\n"
      << "  --listen=<ip:port>        Accept one inbound connection (port 0: ephemeral)\n"
      << "\n"
      << "Probe:\n"
      << "  --subscribe=<tags>        Tags for the MsgOfInterest message (default: AV,PP,TX)\n"
      << "  --ping=<n>                Send n pings after the subscription (default: 0)\n"
      << "  --timeout=<seconds>       Stop after this long, 0 runs until Ctrl-C (default: 30)\n"
      << "  --nohandshake             Skip the HTTP upgrade, frame from the first byte\n"
      << "  --handshake-config=<path> JSON file with handshake header overrides\n"
      << "  --challenge=<value>       Priority challenge sent when listening\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>        Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                            Default: info\n"
      << "  --debug=<component>       Enable trace logging for specific component(s)\n"
      << "                            Components: network, codec, handshake, app, all\n"
      << "                            Can be comma-separated: --debug=network,codec\n"
      << "  --logfile=<path>          Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version                 Show version information\n"
      << "  --help                    Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  using namespace algoprobe;

  try {
    harness::SyntheticNodeConfig config;
    std::string connect_to;
    std::string listen_on;
    std::string handshake_config_path;
    std::optional<std::string> challenge;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;
    std::set<message::Tag> subscribe = {message::Tag::AgreementVote,
                                        message::Tag::ProposalPayload, message::Tag::Txn};
    int ping_count = 0;
    int timeout_seconds = 30;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        return 0;
      } else if (arg.find("--connect=") == 0) {
        connect_to = arg.substr(10);
      } else if (arg.find("--listen=") == 0) {
        listen_on = arg.substr(9);
      } else if (arg.find("--subscribe=") == 0) {
        subscribe.clear();
        for (const auto &code : SplitList(arg.substr(12))) {
          auto tag = message::TagFromCode(code);
          if (!tag) {
            std::cerr << "Error: Unknown tag: " << code << std::endl;
            return 1;
          }
          subscribe.insert(*tag);
        }
      } else if (arg.find("--ping=") == 0) {
        auto n = util::SafeParseInt(arg.substr(7), 0, 1000000);
        if (!n) {
          std::cerr << "Error: Invalid ping count: " << arg.substr(7) << std::endl;
          return 1;
        }
        ping_count = *n;
      } else if (arg.find("--timeout=") == 0) {
        auto t = util::SafeParseInt(arg.substr(10), 0, 86400);
        if (!t) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 0 and 86400" << std::endl;
          return 1;
        }
        timeout_seconds = *t;
      } else if (arg == "--nohandshake") {
        config.handshake = false;
      } else if (arg.find("--handshake-config=") == 0) {
        handshake_config_path = arg.substr(19);
      } else if (arg.find("--challenge=") == 0) {
        challenge = arg.substr(12);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (connect_to.empty() == listen_on.empty()) {
      std::cerr << "Error: exactly one of --connect or --listen is required" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    util::LogManager::Initialize(log_level, !log_file.empty(),
                                 log_file.empty() ? "algoprobe.log" : log_file);
    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        util::LogManager::SetComponentLevel("network", "trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    if (!handshake_config_path.empty()) {
      auto loaded = harness::LoadHandshakeConfig(handshake_config_path);
      if (!loaded) {
        LOG_APP_ERROR("Failed to load handshake config {}", handshake_config_path);
        util::LogManager::Shutdown();
        return 1;
      }
      config.handshake_config = *loaded;
    }
    if (challenge) {
      config.handshake_config.challenge = challenge;
    }

    if (!listen_on.empty()) {
      // SplitHostPort rejects port 0, which is valid here
      const auto colon = listen_on.rfind(':');
      std::optional<int> port;
      if (colon != std::string::npos) {
        port = util::SafeParseInt(listen_on.substr(colon + 1), 0, 65535);
      }
      if (!port || colon == 0) {
        std::cerr << "Error: Invalid listen address: " << listen_on << std::endl;
        util::LogManager::Shutdown();
        return 1;
      }
      config.listen_address = listen_on.substr(0, colon);
      config.listen_port = static_cast<uint16_t>(*port);
    }

    std::cout << GetStartupBanner(listen_on.empty() ? "initiator" : "responder");

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    int exit_code = 0;
    // Nested scope: the node's io threads must be joined before logging shuts down
    {
      harness::SyntheticNode node(config);
      std::string peer;

      if (!connect_to.empty()) {
        if (!node.connect(connect_to)) {
          LOG_APP_ERROR("Could not connect to {}", connect_to);
          exit_code = 1;
        } else {
          peer = node.connected_peers().empty() ? connect_to : node.connected_peers().front();
        }
      } else {
        auto addr = node.start_listening();
        if (!addr) {
          LOG_APP_ERROR("Could not listen on {}", listen_on);
          exit_code = 1;
        } else {
          LOG_APP_INFO("Listening on {}", *addr);
          while (!g_shutdown_requested) {
            auto accepted = node.wait_for_connection(std::chrono::milliseconds(500));
            if (accepted) {
              peer = *accepted;
              break;
            }
          }
        }
      }

      if (!peer.empty()) {
        LOG_APP_INFO("Connected to {}", peer);

        if (!subscribe.empty()) {
          node.unicast(peer, message::MsgOfInterestPayload(subscribe));
        }
        for (int i = 0; i < ping_count; ++i) {
          message::PingNonce nonce{};
          const auto bytes = util::GenerateRandomBytes(nonce.size());
          std::copy(bytes.begin(), bytes.end(), nonce.begin());
          node.unicast(peer, message::PingPayload(nonce));
        }

        const auto deadline =
            std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
        size_t received = 0;
        while (!g_shutdown_requested && node.is_connected(peer)) {
          if (timeout_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
          }
          auto msg = node.recv_message_timeout(std::chrono::milliseconds(100));
          if (!msg) {
            continue;
          }
          ++received;
          const auto &[from, algo_msg] = *msg;
          LOG_APP_INFO("{} from {} ({} bytes)", message::TagName(algo_msg.tag()), from,
                       algo_msg.raw.size());

          if (algo_msg.tag() == message::Tag::Ping) {
            const auto &ping = static_cast<const message::PingPayload &>(*algo_msg.payload);
            node.unicast(from, message::PingReplyPayload(ping.nonce));
          }
        }

        if (!node.is_connected(peer)) {
          LOG_APP_WARN("Peer {} disconnected", peer);
        }
        LOG_APP_INFO("Received {} messages ({} still queued)", received,
                     node.pending_messages());
      }

      node.shut_down();
    }

    util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    algoprobe::util::LogManager::Shutdown();
    return 1;
  }
}
