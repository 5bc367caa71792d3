#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "turnloop/core/message.hpp"
#include "turnloop/core/types.hpp"

namespace turnloop {

struct CompactionStatistics {
  size_t total_messages = 0;
  std::map<Priority, size_t> messages_by_priority;
  size_t total_memory_usage = 0;
  double average_message_size = 0.0;
  std::optional<Timestamp> last_compaction_time;
  double compaction_frequency = 0.0;  // Compactions per hour since the history was created
};

// Ordered conversation entries. At most one entry is a compaction summary.
// Every read and write takes the internal mutex, so readers never see a half-done compaction.
class ConversationHistory {
 public:
  ConversationHistory();

  ConversationHistory(const ConversationHistory&) = delete;
  ConversationHistory& operator=(const ConversationHistory&) = delete;

  // Appends as-is; priority and type are expected to be assigned already
  void append(Message message);

  // Copy of all entries, summary included, in order
  std::vector<Message> messages() const;

  size_t size() const;
  bool empty() const;
  size_t memory_usage() const;

  std::optional<Message> summary() const;

  Timestamp created_at() const;
  std::optional<Timestamp> last_compaction_time() const;
  uint64_t compaction_count() const;

  // Cached snapshot, refreshed on every append, compaction and restore
  CompactionStatistics statistics() const;

  json to_json() const;

  // Replaces the whole content; leaves the history untouched on malformed input
  Status restore(const json& j);

 private:
  friend class CompactionEngine;

  void refresh_statistics_locked();
  size_t memory_usage_locked() const;

  mutable std::mutex mutex_;
  std::vector<Message> entries_;
  Timestamp created_at_;
  std::optional<Timestamp> last_compaction_;
  uint64_t compaction_count_ = 0;
  CompactionStatistics stats_;
};

}  // namespace turnloop
