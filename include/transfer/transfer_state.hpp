#ifndef SFT_TRANSFER_STATE_HPP
#define SFT_TRANSFER_STATE_HPP

#include <ostream>
#include <string>

namespace sft {
namespace transfer {

/**
 * Sender states for one transfer attempt:
 * IDLE         - No file selected
 * FILE_PENDING - A file is selected and waiting for a send request
 * PREPARING    - Key generation, encryption, hashing and hand-off in progress
 * SENT         - Envelope handed to the channel, selection cleared
 * SEND_FAILED  - Attempt failed, selection retained for retry
 */
enum class SenderState {
    IDLE,
    FILE_PENDING,
    PREPARING,
    SENT,
    SEND_FAILED
};

/**
 * Receiver states for one inbound message:
 * WAITING        - Listening for the next message
 * RECEIVING      - Decoding and decrypting the envelope
 * VERIFYING      - Comparing the plaintext digest with the envelope digest
 * RECEIVED       - File verified and exposed to the consumer
 * RECEIVE_FAILED - Nothing exposed, error recorded
 */
enum class ReceiverState {
    WAITING,
    RECEIVING,
    VERIFYING,
    RECEIVED,
    RECEIVE_FAILED
};

class TransferState {
public:
    static bool is_valid_transition(SenderState from, SenderState to);
    static bool is_valid_transition(ReceiverState from, ReceiverState to);

    static bool is_terminal(SenderState state) {
        return state == SenderState::SENT || state == SenderState::SEND_FAILED;
    }
    static bool is_terminal(ReceiverState state) {
        return state == ReceiverState::RECEIVED || state == ReceiverState::RECEIVE_FAILED;
    }

    // Convert state to string for logging
    static std::string state_to_string(SenderState state);
    static std::string state_to_string(ReceiverState state);
};

// Stream operators to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, SenderState state) {
    return os << TransferState::state_to_string(state);
}

inline std::ostream& operator<<(std::ostream& os, ReceiverState state) {
    return os << TransferState::state_to_string(state);
}

} // namespace transfer
} // namespace sft

#endif // SFT_TRANSFER_STATE_HPP
