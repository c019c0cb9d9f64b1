#pragma once

#include <string>
#include <utility>

namespace ferry::session {

// Lifecycle of one transfer, identical on both peers.
//
//   kInit -> kSendingMetadata -> kStreamingChunks -> kAwaitingCompletion
//         -> kVerifying -> {kSuccess | kMismatch}
//
// kFailed is reachable from every non-terminal state. Terminal states accept
// no further transitions.
enum class TransferState {
  kInit,
  kSendingMetadata,
  kStreamingChunks,
  kAwaitingCompletion,
  kVerifying,
  kSuccess,
  kMismatch,
  kFailed,
};

const char* to_string(TransferState state);

bool is_terminal(TransferState state);

bool is_valid_transition(TransferState from, TransferState to);

// Tracks the current state and rejects illegal transitions.
class StateMachine {
 public:
  // label prefixes the transition log lines (session id, role).
  explicit StateMachine(std::string label);

  // Returns false and keeps the current state if the transition is illegal.
  bool advance(TransferState next);

  [[nodiscard]] TransferState state() const { return state_; }
  [[nodiscard]] bool terminal() const { return is_terminal(state_); }

  void set_label(std::string label) { label_ = std::move(label); }

 private:
  std::string label_;
  TransferState state_{TransferState::kInit};
};

}  // namespace ferry::session
