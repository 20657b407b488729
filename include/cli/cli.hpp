#ifndef SFT_CLI_HPP
#define SFT_CLI_HPP

#include <cstdint>
#include <string>
#include "logger/logger.hpp"
#include "transfer/transfer_types.hpp"

namespace sft {
namespace cli {

enum class Mode {
  NONE,
  SEND,
  RECEIVE
};

struct ProgramOptions {
  Mode mode{Mode::NONE};
  std::string host;
  std::string address{"0.0.0.0"};
  uint16_t port{0};
  std::string file;
  std::string output_dir{"."};
  std::string log_file;
  logger::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

// ---- ARGUMENT PARSING ----
void print_usage(const std::string& program_name);
// Reports problems on stderr and returns options with valid == false
ProgramOptions parse_command_line(int argc, char* argv[]);


// ---- DRIVERS ----
// Connects, sends one file and returns true once it left in full
bool run_send(const ProgramOptions& options, const transfer::TransferConfig& config = {});
// Accepts one peer, waits for one inbound file and returns true if it was verified and saved
bool run_receive(const ProgramOptions& options, const transfer::TransferConfig& config = {});

// Entry point used by main, returns the process exit code
int run(int argc, char* argv[]);

} // namespace cli
} // namespace sft

#endif // SFT_CLI_HPP
