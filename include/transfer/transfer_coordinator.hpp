#ifndef SFT_TRANSFER_COORDINATOR_HPP
#define SFT_TRANSFER_COORDINATOR_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "crypto/keyed_cipher.hpp"
#include "network/channel.hpp"
#include "network/codec.hpp"
#include "transfer/transfer_state.hpp"
#include "transfer/transfer_types.hpp"

namespace sft {
namespace transfer {

/**
 * Drives one outbound and any number of inbound file transfers over a channel.
 *
 * All state-machine work runs on a strand of the supplied io_context, so inbound
 * frames are processed one at a time in arrival order and never interleave with
 * a send. Callbacks are invoked on that strand. Handlers must be installed
 * before a channel is attached.
 *
 * Instances are only created through create(). Queued work and channel handlers
 * hold a weak reference and lock it for their whole run, so the last owner may
 * release the coordinator from any thread.
 *
 * The symmetric key travels in the same message as the ciphertext. This only
 * protects against observers of other channels, not against a party able to
 * read this channel.
 */
class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator> {
public:
  using StatusHandler = std::function<void(const std::string&)>;
  using FileReadyHandler = std::function<void(const ReceivedFile&)>;

  // Delete copy constructor and assignment operator
  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  static std::shared_ptr<TransferCoordinator> create(boost::asio::io_context& io_context,
                                                     TransferConfig config = {});
  ~TransferCoordinator();


  // ---- CHANNEL MANAGEMENT ----
  // Subscribes to the channel, releasing any previous subscription
  void attach_channel(std::shared_ptr<network::Channel> channel);
  void detach_channel();


  // ---- OBSERVERS ----
  void set_status_handler(StatusHandler handler);
  void set_file_ready_handler(FileReadyHandler handler);


  // ---- USER ACTIONS ----
  // Replaces any unsent selection
  void select_file(PendingFile file);
  // Returns false if a send is already queued or preparing
  bool request_send();
  // Hands over the held received file and clears the slot
  std::optional<ReceivedFile> export_received();


  // ---- QUERIES ----
  SenderState sender_state() const;
  ReceiverState receiver_state() const;
  std::optional<ReceiverState> last_receive_outcome() const;
  std::string status() const;
  std::string last_error() const;
  bool has_pending_file() const;
  bool has_received_file() const;
  bool send_in_flight() const { return send_in_flight_; }

private:
  TransferCoordinator(boost::asio::io_context& io_context, TransferConfig config);

  struct State {
    SenderState sender = SenderState::IDLE;
    ReceiverState receiver = ReceiverState::WAITING;
    std::optional<ReceiverState> last_receive_outcome;
    std::optional<PendingFile> pending;
    std::optional<ReceivedFile> received;
    std::string status;
    std::string last_error;
  };

  // ---- PARAMETERS ----
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  TransferConfig config_;

  // Only touched on the strand
  crypto::KeyedCipher cipher_;
  network::Codec codec_;

  mutable std::mutex mutex_;
  State state_;
  std::shared_ptr<network::Channel> channel_;
  network::Subscription subscription_;
  std::atomic<bool> send_in_flight_{false};

  StatusHandler status_handler_;
  FileReadyHandler file_ready_handler_;

  // ---- SENDER STATE MACHINE ----
  void do_select(PendingFile file);
  void do_send();
  void fail_send(const std::string& reason);


  // ---- RECEIVER STATE MACHINE ----
  // Runs on the channel's thread, queues the frame onto the strand
  void on_frame(const network::Frame& frame);
  void do_receive(const network::Frame& frame);
  void receive_file(const network::FileData& file_data);
  void fail_receive(const std::string& reason);


  // ---- STATE HELPERS ----
  bool transition(SenderState to);
  bool transition(ReceiverState to);
  void publish_status(const std::string& text);
};

} // namespace transfer
} // namespace sft

#endif // SFT_TRANSFER_COORDINATOR_HPP
