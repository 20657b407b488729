#include "transfer/transfer_coordinator.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/integrity_hasher.hpp"
#include "network/network_error.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace sft {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferCoordinator::TransferCoordinator(boost::asio::io_context& io_context, TransferConfig config)
  : strand_(boost::asio::make_strand(io_context))
  , config_(config)
  , cipher_(config.max_payload_size)
  , codec_(config.max_frame_size()) {
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Initialized with max payload size " << config_.max_payload_size;
}

std::shared_ptr<TransferCoordinator> TransferCoordinator::create(boost::asio::io_context& io_context,
                                                                 TransferConfig config) {
  return std::shared_ptr<TransferCoordinator>(new TransferCoordinator(io_context, config));
}

TransferCoordinator::~TransferCoordinator() {
  detach_channel();
  BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Destroyed";
}

//==============================================
// CHANNEL MANAGEMENT
//==============================================

void TransferCoordinator::attach_channel(std::shared_ptr<network::Channel> channel) {
  if (!channel) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer coordinator: Attempted to attach null channel";
    detach_channel();
    return;
  }

  std::weak_ptr<TransferCoordinator> weak_self = weak_from_this();
  auto subscription = channel->subscribe(
    [weak_self](const network::Frame& frame) {
      // Channels may still call a handler copy taken before detach
      if (auto self = weak_self.lock()) {
        self->on_frame(frame);
      }
    });

  std::lock_guard<std::mutex> lock(mutex_);
  // Move-assignment releases the subscription on the previous channel
  subscription_ = std::move(subscription);
  channel_ = std::move(channel);
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Channel attached";
}

void TransferCoordinator::detach_channel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (channel_) {
    subscription_.reset();
    channel_.reset();
    BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Channel detached";
  }
}

//==============================================
// OBSERVERS
//==============================================

void TransferCoordinator::set_status_handler(StatusHandler handler) {
  status_handler_ = std::move(handler);
}

void TransferCoordinator::set_file_ready_handler(FileReadyHandler handler) {
  file_ready_handler_ = std::move(handler);
}

//==============================================
// USER ACTIONS
//==============================================

void TransferCoordinator::select_file(PendingFile file) {
  boost::asio::post(strand_, [weak_self = weak_from_this(), file = std::move(file)]() mutable {
    if (auto self = weak_self.lock()) {
      self->do_select(std::move(file));
    }
  });
}

bool TransferCoordinator::request_send() {
  bool expected = false;
  if (!send_in_flight_.compare_exchange_strong(expected, true)) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer coordinator: Send already in progress, request rejected";
    return false;
  }

  boost::asio::post(strand_, [weak_self = weak_from_this()]() {
    if (auto self = weak_self.lock()) {
      self->do_send();
      self->send_in_flight_ = false;
    }
  });
  return true;
}

std::optional<ReceivedFile> TransferCoordinator::export_received() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!state_.received) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: No received file to export";
    return std::nullopt;
  }

  std::optional<ReceivedFile> file = std::move(state_.received);
  state_.received.reset();
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Exported received file: " << file->name;
  return file;
}

//==============================================
// SENDER STATE MACHINE
//==============================================

void TransferCoordinator::do_select(PendingFile file) {
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: File selected: " << file.name
                          << " (" << file.contents.size() << " bytes, " << file.mime_type << ")";
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.pending) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Replacing pending file: " << state_.pending->name;
    }
    state_.pending = std::move(file);
  }
  transition(SenderState::FILE_PENDING);
  publish_status("File selected");
}

void TransferCoordinator::do_send() {
  std::shared_ptr<network::Channel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    channel = channel_;
    if (!state_.pending) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Send requested with no pending file, ignoring";
      return;
    }
  }

  if (!channel || !channel->is_connected()) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Send requested without a connected channel, ignoring";
    return;
  }

  // The pending file is only replaced on this strand, so it is stable until we return
  const PendingFile& file = *state_.pending;

  transition(SenderState::PREPARING);
  publish_status("Preparing file...");
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Preparing file: " << file.name;

  try {
    network::FileData file_data;
    file_data.name = file.name;
    file_data.mime_type = file.mime_type;
    file_data.size = file.contents.size();
    file_data.key = cipher_.generate_key();
    file_data.data = cipher_.encrypt(file.contents, file_data.key);
    // Digest covers the original plaintext, never the ciphertext
    file_data.hash = crypto::IntegrityHasher::digest(file.contents);

    BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Plaintext digest: "
                             << crypto::IntegrityHasher::to_hex(file_data.hash);

    network::Frame frame = codec_.encode(network::FileIncoming{std::move(file_data)});
    channel->send(frame);

    BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Sent " << file.name << " in frame of " << frame.size() << " bytes";
  }
  catch (const crypto::CipherError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Cipher error while sending: " << e.what();
    fail_send(e.what());
    return;
  }
  catch (const network::ChannelError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Channel error while sending: " << e.what();
    fail_send(e.what());
    return;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Error sending file: " << e.what();
    fail_send(e.what());
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.pending.reset();
    state_.last_error.clear();
  }
  transition(SenderState::SENT);
  publish_status("File sent successfully");
}

void TransferCoordinator::fail_send(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_error = reason;
  }
  transition(SenderState::SEND_FAILED);
  publish_status("Error sending file: " + reason);
}

//==============================================
// RECEIVER STATE MACHINE
//==============================================

void TransferCoordinator::on_frame(const network::Frame& frame) {
  boost::asio::post(strand_, [weak_self = weak_from_this(), frame]() {
    // Holding self keeps the coordinator alive for the whole receive
    if (auto self = weak_self.lock()) {
      self->do_receive(frame);
    }
  });
}

void TransferCoordinator::do_receive(const network::Frame& frame) {
  network::Message message;
  try {
    message = codec_.decode(frame);
  }
  catch (const network::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Malformed inbound frame: " << e.what();
    transition(ReceiverState::RECEIVING);
    fail_receive(e.what());
    return;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Failed to decode inbound frame: " << e.what();
    transition(ReceiverState::RECEIVING);
    fail_receive(e.what());
    return;
  }

  const auto* incoming = std::get_if<network::FileIncoming>(&message);
  if (!incoming) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Ignoring message of type: " << network::message_type(message);
    return;
  }

  receive_file(incoming->file_data);
}

void TransferCoordinator::receive_file(const network::FileData& file_data) {
  transition(ReceiverState::RECEIVING);
  publish_status("Receiving file...");
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Receiving file: " << file_data.name
                          << " (" << file_data.size << " bytes declared)";

  ReceivedFile received;
  try {
    if (file_data.size > config_.max_payload_size) {
      throw network::ProtocolError("Declared file size exceeds limit");
    }

    std::vector<uint8_t> plaintext = cipher_.decrypt(file_data.data, file_data.key);

    transition(ReceiverState::VERIFYING);
    // Decrypt, then hash, then compare
    crypto::Digest digest = crypto::IntegrityHasher::digest(plaintext);
    if (digest != file_data.hash) {
      BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Digest mismatch, expected "
                               << crypto::IntegrityHasher::to_hex(file_data.hash)
                               << " got " << crypto::IntegrityHasher::to_hex(digest);
      throw IntegrityError("File integrity check failed");
    }

    if (plaintext.size() != file_data.size) {
      throw network::ProtocolError("Declared file size does not match contents");
    }

    received.name = file_data.name;
    received.mime_type = file_data.mime_type;
    received.size = file_data.size;
    received.contents = std::move(plaintext);
  }
  catch (const IntegrityError& e) {
    fail_receive(e.what());
    return;
  }
  catch (const crypto::CipherError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Cipher error while receiving: " << e.what();
    fail_receive(e.what());
    return;
  }
  catch (const network::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Protocol error while receiving: " << e.what();
    fail_receive(e.what());
    return;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Error receiving file: " << e.what();
    fail_receive(e.what());
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.received) {
      BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Replacing unexported file: " << state_.received->name;
    }
    state_.received = received;
    state_.last_receive_outcome = ReceiverState::RECEIVED;
    state_.last_error.clear();
  }
  transition(ReceiverState::RECEIVED);
  publish_status("File received and verified");
  BOOST_LOG_TRIVIAL(info) << "Transfer coordinator: Received and verified: " << received.name;

  if (file_ready_handler_) {
    file_ready_handler_(received);
  }

  transition(ReceiverState::WAITING);
}

void TransferCoordinator::fail_receive(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_error = reason;
    state_.last_receive_outcome = ReceiverState::RECEIVE_FAILED;
  }
  transition(ReceiverState::RECEIVE_FAILED);
  publish_status("Error receiving file: " + reason);
  transition(ReceiverState::WAITING);
}

//==============================================
// STATE HELPERS
//==============================================

bool TransferCoordinator::transition(SenderState to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!TransferState::is_valid_transition(state_.sender, to)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Invalid sender transition "
                             << state_.sender << " -> " << to;
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Sender " << state_.sender << " -> " << to;
  state_.sender = to;
  return true;
}

bool TransferCoordinator::transition(ReceiverState to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!TransferState::is_valid_transition(state_.receiver, to)) {
    BOOST_LOG_TRIVIAL(error) << "Transfer coordinator: Invalid receiver transition "
                             << state_.receiver << " -> " << to;
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer coordinator: Receiver " << state_.receiver << " -> " << to;
  state_.receiver = to;
  return true;
}

void TransferCoordinator::publish_status(const std::string& text) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.status = text;
  }
  if (status_handler_) {
    status_handler_(text);
  }
}

//==============================================
// QUERIES
//==============================================

SenderState TransferCoordinator::sender_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.sender;
}

ReceiverState TransferCoordinator::receiver_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.receiver;
}

std::optional<ReceiverState> TransferCoordinator::last_receive_outcome() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.last_receive_outcome;
}

std::string TransferCoordinator::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.status;
}

std::string TransferCoordinator::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.last_error;
}

bool TransferCoordinator::has_pending_file() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.pending.has_value();
}

bool TransferCoordinator::has_received_file() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.received.has_value();
}

} // namespace transfer
} // namespace sft
