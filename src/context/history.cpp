#include "turnloop/context/history.hpp"

#include <numeric>

namespace turnloop {

ConversationHistory::ConversationHistory() : created_at_(std::chrono::system_clock::now()) {
  refresh_statistics_locked();
}

void ConversationHistory::append(Message message) {
  std::lock_guard lock(mutex_);
  entries_.push_back(std::move(message));
  refresh_statistics_locked();
}

std::vector<Message> ConversationHistory::messages() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

size_t ConversationHistory::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

bool ConversationHistory::empty() const {
  std::lock_guard lock(mutex_);
  return entries_.empty();
}

size_t ConversationHistory::memory_usage() const {
  std::lock_guard lock(mutex_);
  return memory_usage_locked();
}

size_t ConversationHistory::memory_usage_locked() const {
  return std::accumulate(entries_.begin(), entries_.end(), size_t(0), [](size_t total, const Message& msg) {
    return total + msg.byte_size();
  });
}

std::optional<Message> ConversationHistory::summary() const {
  std::lock_guard lock(mutex_);
  for (const auto& msg : entries_) {
    if (msg.is_summary()) {
      return msg;
    }
  }
  return std::nullopt;
}

Timestamp ConversationHistory::created_at() const {
  std::lock_guard lock(mutex_);
  return created_at_;
}

std::optional<Timestamp> ConversationHistory::last_compaction_time() const {
  std::lock_guard lock(mutex_);
  return last_compaction_;
}

uint64_t ConversationHistory::compaction_count() const {
  std::lock_guard lock(mutex_);
  return compaction_count_;
}

CompactionStatistics ConversationHistory::statistics() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

void ConversationHistory::refresh_statistics_locked() {
  CompactionStatistics stats;
  stats.total_messages = entries_.size();
  for (auto p : {Priority::Low, Priority::Normal, Priority::High, Priority::Critical}) {
    stats.messages_by_priority[p] = 0;
  }
  for (const auto& msg : entries_) {
    stats.messages_by_priority[msg.priority()]++;
  }
  stats.total_memory_usage = memory_usage_locked();
  if (!entries_.empty()) {
    stats.average_message_size = static_cast<double>(stats.total_memory_usage) / static_cast<double>(entries_.size());
  }
  stats.last_compaction_time = last_compaction_;

  auto elapsed = std::chrono::duration<double, std::ratio<3600>>(std::chrono::system_clock::now() - created_at_).count();
  if (elapsed > 0.0) {
    stats.compaction_frequency = static_cast<double>(compaction_count_) / elapsed;
  }

  stats_ = std::move(stats);
}

json ConversationHistory::to_json() const {
  std::lock_guard lock(mutex_);
  json j;
  j["created_at"] = to_epoch_seconds(created_at_);
  if (last_compaction_) {
    j["last_compaction"] = to_epoch_seconds(*last_compaction_);
  }
  j["compaction_count"] = compaction_count_;

  json entries = json::array();
  for (const auto& msg : entries_) {
    entries.push_back(msg.to_json());
  }
  j["messages"] = entries;
  return j;
}

Status ConversationHistory::restore(const json& j) {
  if (!j.is_object() || !j.contains("messages") || !j["messages"].is_array()) {
    return Status::failure(ErrorKind::SnapshotFailure, "History state has no message list");
  }

  std::vector<Message> entries;
  Timestamp created_at;
  std::optional<Timestamp> last_compaction;
  uint64_t compaction_count = 0;
  try {
    for (const auto& msg_json : j["messages"]) {
      entries.push_back(Message::from_json(msg_json));
    }
    created_at = from_epoch_seconds(j.value("created_at", to_epoch_seconds(std::chrono::system_clock::now())));
    if (j.contains("last_compaction")) {
      last_compaction = from_epoch_seconds(j["last_compaction"].get<int64_t>());
    }
    compaction_count = j.value("compaction_count", uint64_t(0));
  } catch (const json::exception& e) {
    return Status::failure(ErrorKind::SnapshotFailure, std::string("Malformed history state: ") + e.what());
  }

  std::lock_guard lock(mutex_);
  entries_ = std::move(entries);
  created_at_ = created_at;
  last_compaction_ = last_compaction;
  compaction_count_ = compaction_count;
  refresh_statistics_locked();
  return Status::success();
}

}  // namespace turnloop
