#include "server/session_registry.h"

#include <utility>

#include "common/logging/logger.h"

namespace ferry::server {

SessionRegistry::SessionRegistry(std::chrono::seconds retention,
                                 std::function<TimePoint()> now_fn)
    : retention_(retention), now_fn_(std::move(now_fn)) {}

bool SessionRegistry::record(SessionRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.find(record.session_id) != records_.end()) {
    stats_.duplicate_writes++;
    LOG_WARN("Session {} already recorded, keeping the first record", record.session_id);
    return false;
  }

  LOG_DEBUG("Recorded session {} ({})", record.session_id, session::to_string(record.state));
  std::string id = record.session_id;
  records_.emplace(std::move(id), std::move(record));
  stats_.records_written++;
  stats_.records_held = records_.size();
  return true;
}

std::optional<SessionRecord> SessionRegistry::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(session_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t SessionRegistry::cleanup_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = now_fn_();
  std::size_t removed = 0;

  for (auto it = records_.begin(); it != records_.end();) {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - it->second.finished_at);
    if (age >= retention_) {
      LOG_DEBUG("Session record {} expired", it->first);
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  stats_.records_expired += removed;
  stats_.records_held = records_.size();
  return removed;
}

std::vector<SessionRecord> SessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionRecord> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  return result;
}

SessionRegistryStats SessionRegistry::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::string SessionIdGenerator::next(const transport::Endpoint& peer) {
  const auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
  std::uint64_t counter = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    counter = ++counter_;
  }
  return transport::to_string(peer) + "_" + std::to_string(unix_seconds) + "_" +
         std::to_string(counter);
}

}  // namespace ferry::server
