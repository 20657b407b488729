#include "transfer/transfer_state.hpp"

namespace sft {
namespace transfer {

bool TransferState::is_valid_transition(SenderState from, SenderState to) {
    switch (from) {
        case SenderState::IDLE:
            return to == SenderState::FILE_PENDING;

        case SenderState::FILE_PENDING:
            return to == SenderState::FILE_PENDING ||
                   to == SenderState::PREPARING;

        case SenderState::PREPARING:
            return to == SenderState::SENT ||
                   to == SenderState::SEND_FAILED;

        case SenderState::SENT:
            return to == SenderState::FILE_PENDING;

        case SenderState::SEND_FAILED:
            return to == SenderState::FILE_PENDING ||
                   to == SenderState::PREPARING;
    }
    return false;
}

bool TransferState::is_valid_transition(ReceiverState from, ReceiverState to) {
    switch (from) {
        case ReceiverState::WAITING:
            return to == ReceiverState::RECEIVING;

        case ReceiverState::RECEIVING:
            return to == ReceiverState::VERIFYING ||
                   to == ReceiverState::RECEIVE_FAILED;

        case ReceiverState::VERIFYING:
            return to == ReceiverState::RECEIVED ||
                   to == ReceiverState::RECEIVE_FAILED;

        case ReceiverState::RECEIVED:
        case ReceiverState::RECEIVE_FAILED:
            return to == ReceiverState::WAITING;
    }
    return false;
}

std::string TransferState::state_to_string(SenderState state) {
    switch (state) {
        case SenderState::IDLE:         return "IDLE";
        case SenderState::FILE_PENDING: return "FILE_PENDING";
        case SenderState::PREPARING:    return "PREPARING";
        case SenderState::SENT:         return "SENT";
        case SenderState::SEND_FAILED:  return "SEND_FAILED";
        default:                        return "UNKNOWN";
    }
}

std::string TransferState::state_to_string(ReceiverState state) {
    switch (state) {
        case ReceiverState::WAITING:        return "WAITING";
        case ReceiverState::RECEIVING:      return "RECEIVING";
        case ReceiverState::VERIFYING:      return "VERIFYING";
        case ReceiverState::RECEIVED:       return "RECEIVED";
        case ReceiverState::RECEIVE_FAILED: return "RECEIVE_FAILED";
        default:                            return "UNKNOWN";
    }
}

} // namespace transfer
} // namespace sft
