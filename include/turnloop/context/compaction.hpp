#pragma once

#include <string>

#include "turnloop/context/history.hpp"
#include "turnloop/core/config.hpp"
#include "turnloop/core/message.hpp"

namespace turnloop {

struct CompactionResult {
  size_t messages_processed = 0;
  size_t messages_compacted = 0;
  size_t original_size = 0;
  size_t compacted_size = 0;
  double compression_ratio = 1.0;  // compacted_size / original_size
  Milliseconds processing_time{0};
};

// Keeps a ConversationHistory within its message, memory and age limits by folding
// low-value messages into a single summary entry
class CompactionEngine {
 public:
  explicit CompactionEngine(CompactionConfig config);

  // Classifies the message and appends it; returns the stored copy
  Message add_message(ConversationHistory& history, const Message& message);
  Message add_message(ConversationHistory& history, Role role, const std::string& content, MessageType type);

  bool should_compact(const ConversationHistory& history) const;

  // Evicts what the limits require and folds it into the summary
  CompactionResult compact_messages_intelligently(ConversationHistory& history);

  // Same eviction order, with a tighter entry limit (context overflow recovery)
  CompactionResult compact_to(ConversationHistory& history, size_t max_entries);

  CompactionStatistics get_statistics(const ConversationHistory& history) const;

  // Keyword-based importance of a message entering the history
  static Priority analyze_priority(const Message& message, MessageType type);

  static double context_confidence(Priority priority);

  const CompactionConfig& config() const {
    return config_;
  }

 private:
  CompactionResult compact(ConversationHistory& history, size_t max_entries);

  CompactionConfig config_;
};

}  // namespace turnloop
