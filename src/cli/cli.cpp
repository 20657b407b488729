#include "cli/cli.hpp"
#include "network/network_error.hpp"
#include "network/tcp_channel.hpp"
#include "transfer/transfer_coordinator.hpp"
#include "utils/file_source.hpp"
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace sft {
namespace cli {

namespace {

constexpr auto DISCONNECT_POLL_INTERVAL = std::chrono::milliseconds(200);

enum class Flag {
  HOST,
  ADDRESS,
  PORT,
  FILE,
  OUTPUT,
  LOG_FILE,
  LOG_LEVEL
};

void print_status(const std::string& status) {
  std::cout << status << std::endl;
}

// Stops the receive loop once the peer is gone. One extra tick lets frames
// already queued on the io_context drain before giving up.
void watch_connection(boost::asio::steady_timer& timer,
                      const std::shared_ptr<network::TCP_Channel>& channel,
                      bool disconnect_seen,
                      const std::function<void()>& on_disconnect) {
  timer.expires_after(DISCONNECT_POLL_INTERVAL);
  timer.async_wait([&timer, channel, disconnect_seen, on_disconnect](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (!channel->is_connected()) {
      if (disconnect_seen) {
        on_disconnect();
        return;
      }
      watch_connection(timer, channel, true, on_disconnect);
      return;
    }
    watch_connection(timer, channel, false, on_disconnect);
  });
}

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " send -h <host> -p <port> -f <file> [options]\n"
            << "       " << program_name << " receive -p <port> [-a <address>] [-o <dir>] [options]\n"
            << "Send arguments:\n"
            << "  -h, --host       Receiver host\n"
            << "  -p, --port       Receiver port\n"
            << "  -f, --file       File to send\n"
            << "Receive arguments:\n"
            << "  -a, --address    Listen address (default 0.0.0.0)\n"
            << "  -p, --port       Listen port\n"
            << "  -o, --output     Directory for received files (default .)\n"
            << "Options:\n"
            << "  --log-file       Write logs to this file instead of the console\n"
            << "  --log-level      trace|debug|info|warning|error|fatal (default info)\n"
            << "Example: " << program_name << " send -h 127.0.0.1 -p 3001 -f report.pdf\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-h", Flag::HOST},
    {"--host", Flag::HOST},
    {"-a", Flag::ADDRESS},
    {"--address", Flag::ADDRESS},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"-f", Flag::FILE},
    {"--file", Flag::FILE},
    {"-o", Flag::OUTPUT},
    {"--output", Flag::OUTPUT},
    {"--log-file", Flag::LOG_FILE},
    {"--log-level", Flag::LOG_LEVEL}
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "sft";

  if (argc < 2) {
    print_usage(program_name);
    return options;
  }

  const std::string mode(argv[1]);
  if (mode == "send") {
    options.mode = Mode::SEND;
  } else if (mode == "receive") {
    options.mode = Mode::RECEIVE;
  } else {
    std::cerr << "Error: Unknown mode: " << mode << '\n';
    print_usage(program_name);
    return options;
  }

  if ((argc - 2) % 2 != 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
    print_usage(program_name);
    return options;
  }

  for (int i = 2; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name);
      return options;
    }

    switch (it->second) {
      case Flag::HOST:
        options.host = value;
        break;
      case Flag::ADDRESS:
        options.address = value;
        break;
      case Flag::PORT:
        try {
          int port = std::stoi(value);
          if (port <= 0 || port > 65535) {
            throw std::out_of_range("port");
          }
          options.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
          std::cerr << "Error: Invalid port number: " << value << '\n';
          print_usage(program_name);
          return options;
        }
        break;
      case Flag::FILE:
        options.file = value;
        break;
      case Flag::OUTPUT:
        options.output_dir = value;
        break;
      case Flag::LOG_FILE:
        options.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        try {
          options.log_level = logger::parse_severity(value);
        } catch (const std::invalid_argument& e) {
          std::cerr << "Error: " << e.what() << '\n';
          print_usage(program_name);
          return options;
        }
        break;
    }
  }

  if (options.port == 0) {
    std::cerr << "Error: Port is required\n";
    print_usage(program_name);
    return options;
  }

  if (options.mode == Mode::SEND && (options.host.empty() || options.file.empty())) {
    std::cerr << "Error: send requires both host and file\n";
    print_usage(program_name);
    return options;
  }

  options.valid = true;
  return options;
}

//==============================================
// DRIVERS
//==============================================

bool run_send(const ProgramOptions& options, const transfer::TransferConfig& config) {
  try {
    transfer::PendingFile file = utils::load_pending_file(options.file, config.max_payload_size);

    boost::asio::io_context io_context;
    auto channel = network::TCP_Channel::connect(io_context, options.host, options.port, config.max_frame_size());

    auto coordinator = transfer::TransferCoordinator::create(io_context, config);
    coordinator->set_status_handler(print_status);
    coordinator->attach_channel(channel);

    coordinator->select_file(std::move(file));
    if (!coordinator->request_send()) {
      std::cerr << "Error: Send already in progress\n";
      return false;
    }

    // Returns once the queued select and send have run
    io_context.run();

    coordinator->detach_channel();
    channel->close();

    if (coordinator->sender_state() != transfer::SenderState::SENT) {
      std::cerr << "Error: " << coordinator->status() << '\n';
      return false;
    }
    return true;
  }
  catch (const utils::FileSourceError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
  catch (const network::ChannelError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Send failed: " << e.what();
    std::cerr << "Error: Send failed: " << e.what() << '\n';
    return false;
  }
}

bool run_receive(const ProgramOptions& options, const transfer::TransferConfig& config) {
  try {
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(options.address), options.port);
    boost::asio::ip::tcp::acceptor acceptor(io_context, endpoint);
    std::cout << "Listening on " << acceptor.local_endpoint() << std::endl;

    auto channel = network::TCP_Channel::accept(acceptor, config.max_frame_size());
    acceptor.close();

    auto work = boost::asio::make_work_guard(io_context);
    boost::asio::steady_timer watchdog(io_context);

    auto coordinator = transfer::TransferCoordinator::create(io_context, config);
    coordinator->set_status_handler([&](const std::string& status) {
      print_status(status);
      if (coordinator->last_receive_outcome()) {
        work.reset();
        watchdog.cancel();
      }
    });
    coordinator->attach_channel(channel);

    if (!channel->start_reading()) {
      std::cerr << "Error: Failed to start reading from peer\n";
      return false;
    }

    watch_connection(watchdog, channel, false, [&]() {
      BOOST_LOG_TRIVIAL(warning) << "CLI: Peer disconnected before a file arrived";
      work.reset();
    });

    io_context.run();

    coordinator->detach_channel();
    channel->close();

    if (coordinator->last_receive_outcome() != transfer::ReceiverState::RECEIVED) {
      const std::string reason = coordinator->last_error();
      std::cerr << "Error: " << (reason.empty() ? std::string("No file received") : reason) << '\n';
      return false;
    }

    std::optional<transfer::ReceivedFile> file = coordinator->export_received();
    if (!file) {
      std::cerr << "Error: Received file is no longer available\n";
      return false;
    }

    const auto path = utils::save_received_file(*file, options.output_dir);
    std::cout << "Saved " << file->size << " bytes to " << path.string() << std::endl;
    return true;
  }
  catch (const utils::FileSourceError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
  catch (const network::ChannelError& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Failed to listen on " << options.address << ":" << options.port
                             << ": " << e.what();
    std::cerr << "Error: Failed to listen: " << e.what() << '\n';
    return false;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "CLI: Receive failed: " << e.what();
    std::cerr << "Error: Receive failed: " << e.what() << '\n';
    return false;
  }
}

int run(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    logger::init_logging(options.log_file, options.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  const bool ok = options.mode == Mode::SEND ? run_send(options) : run_receive(options);
  return ok ? 0 : 1;
}

} // namespace cli
} // namespace sft
