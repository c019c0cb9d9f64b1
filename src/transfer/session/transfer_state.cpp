#include "transfer/session/transfer_state.h"

#include <utility>

#include "common/logging/logger.h"

namespace ferry::session {

const char* to_string(TransferState state) {
  switch (state) {
    case TransferState::kInit:
      return "INIT";
    case TransferState::kSendingMetadata:
      return "SENDING_METADATA";
    case TransferState::kStreamingChunks:
      return "STREAMING_CHUNKS";
    case TransferState::kAwaitingCompletion:
      return "AWAITING_COMPLETION";
    case TransferState::kVerifying:
      return "VERIFYING";
    case TransferState::kSuccess:
      return "SUCCESS";
    case TransferState::kMismatch:
      return "MISMATCH";
    case TransferState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

bool is_terminal(TransferState state) {
  return state == TransferState::kSuccess || state == TransferState::kMismatch ||
         state == TransferState::kFailed;
}

bool is_valid_transition(TransferState from, TransferState to) {
  if (is_terminal(from)) {
    return false;
  }
  if (to == TransferState::kFailed) {
    return true;
  }
  switch (from) {
    case TransferState::kInit:
      return to == TransferState::kSendingMetadata;
    case TransferState::kSendingMetadata:
      return to == TransferState::kStreamingChunks;
    case TransferState::kStreamingChunks:
      return to == TransferState::kAwaitingCompletion;
    case TransferState::kAwaitingCompletion:
      return to == TransferState::kVerifying;
    case TransferState::kVerifying:
      return to == TransferState::kSuccess || to == TransferState::kMismatch;
    default:
      return false;
  }
}

StateMachine::StateMachine(std::string label) : label_(std::move(label)) {}

bool StateMachine::advance(TransferState next) {
  if (!is_valid_transition(state_, next)) {
    LOG_WARN("[{}] Rejected transition {} -> {}", label_, to_string(state_), to_string(next));
    return false;
  }
  LOG_DEBUG("[{}] {} -> {}", label_, to_string(state_), to_string(next));
  state_ = next;
  return true;
}

}  // namespace ferry::session
