#include "turnloop/context/compaction.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace turnloop {

namespace {

constexpr size_t kMaxSummaryBytes = 4096;
constexpr size_t kSnippetBytes = 120;

const std::set<std::string> kSecurityKeywords = {"password", "token", "key", "secret", "auth", "login", "permission"};
const std::set<std::string> kCodeKeywords = {"function", "class", "struct", "enum", "impl", "trait", "mod", "use"};
const std::set<std::string> kDecisionKeywords = {"decision", "choose", "select", "option", "alternative", "recommend"};

// Lowercase alphanumeric words of text
std::vector<std::string> words_of(const std::string& text) {
  std::vector<std::string> words;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '_') {
      current += static_cast<char>(std::tolower(c));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

// Whole-word match, plural included
bool mentions_any(const std::vector<std::string>& words, const std::set<std::string>& keywords) {
  for (const auto& word : words) {
    if (keywords.count(word)) return true;
    if (word.size() > 1 && word.back() == 's' && keywords.count(word.substr(0, word.size() - 1))) return true;
  }
  return false;
}

// Cut at or below max_bytes without splitting a UTF-8 sequence
std::string cut_utf8(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

// Messages evicted together: an assistant message with tool calls plus the results answering it
struct EvictionUnit {
  std::vector<size_t> indices;
  Priority priority = Priority::Low;
  Timestamp oldest;
  size_t bytes = 0;
};

std::vector<EvictionUnit> build_units(const std::vector<Message>& entries) {
  std::vector<EvictionUnit> units;
  std::map<ToolCallId, size_t> open_calls;  // call id -> unit index

  for (size_t i = 0; i < entries.size(); ++i) {
    const auto& msg = entries[i];
    if (msg.is_summary()) continue;

    std::optional<size_t> owner;
    if (msg.role() == Role::Tool) {
      for (const auto* tr : msg.tool_results()) {
        auto it = open_calls.find(tr->tool_call_id);
        if (it != open_calls.end()) {
          owner = it->second;
          break;
        }
      }
    }

    if (!owner) {
      units.push_back(EvictionUnit{{}, msg.priority(), msg.created_at(), 0});
      owner = units.size() - 1;
      if (msg.role() == Role::Assistant) {
        for (const auto* tc : msg.tool_calls()) {
          open_calls[tc->id] = *owner;
        }
      }
    }

    auto& unit = units[*owner];
    unit.indices.push_back(i);
    unit.priority = std::max(unit.priority, msg.priority());
    unit.oldest = std::min(unit.oldest, msg.created_at());
    unit.bytes += msg.byte_size();
  }

  return units;
}

}  // namespace

CompactionEngine::CompactionEngine(CompactionConfig config) : config_(std::move(config)) {}

double CompactionEngine::context_confidence(Priority priority) {
  switch (priority) {
    case Priority::Critical:
      return 1.0;
    case Priority::High:
      return 0.75;
    case Priority::Normal:
      return 0.5;
    case Priority::Low:
      return 0.25;
  }
  return 0.5;
}

Priority CompactionEngine::analyze_priority(const Message& message, MessageType type) {
  if (type == MessageType::SystemNote) {
    return Priority::Critical;
  }

  auto content = message.content_text();
  auto words = words_of(content);
  if (mentions_any(words, kSecurityKeywords)) {
    return Priority::Critical;
  }

  switch (type) {
    case MessageType::UserMessage:
      return (mentions_any(words, kDecisionKeywords) || mentions_any(words, kCodeKeywords)) ? Priority::High : Priority::Normal;
    case MessageType::AssistantMessage:
      return mentions_any(words, kDecisionKeywords) ? Priority::High : Priority::Normal;
    case MessageType::ToolResult: {
      auto lower = to_lower(content);
      return (lower.find("error") != std::string::npos || lower.find("fail") != std::string::npos) ? Priority::High : Priority::Low;
    }
    case MessageType::SystemNote:
      break;
  }
  return Priority::Critical;
}

Message CompactionEngine::add_message(ConversationHistory& history, const Message& message) {
  auto type = message.type();
  auto stored = message.classified(type, analyze_priority(message, type));
  history.append(stored);
  return stored;
}

Message CompactionEngine::add_message(ConversationHistory& history, Role role, const std::string& content, MessageType type) {
  Message message = Message::user(content);
  switch (role) {
    case Role::System:
      message = Message::system(content);
      break;
    case Role::Assistant:
      message = Message::assistant(content);
      break;
    case Role::Tool:
      message = Message::tool_result(UUID::generate(), "", content);
      break;
    case Role::User:
      break;
  }
  return add_message(history, message.classified(type, message.priority()));
}

bool CompactionEngine::should_compact(const ConversationHistory& history) const {
  std::lock_guard lock(history.mutex_);
  const auto& entries = history.entries_;
  auto now = std::chrono::system_clock::now();

  if (entries.size() > config_.max_uncompressed_messages) {
    return true;
  }

  if (history.memory_usage_locked() > config_.max_memory_bytes) {
    return true;
  }

  for (const auto& msg : entries) {
    if (msg.priority() != Priority::Critical && now - msg.created_at() > config_.max_message_age) {
      return true;
    }
  }

  if (config_.auto_compaction_enabled) {
    auto since = history.last_compaction_.value_or(history.created_at_);
    if (now - since >= config_.compaction_interval) {
      for (const auto& unit : build_units(entries)) {
        if (unit.priority != Priority::Critical &&
            (context_confidence(unit.priority) < config_.min_context_confidence || now - unit.oldest > config_.max_context_age)) {
          return true;
        }
      }
    }
  }

  return false;
}

CompactionResult CompactionEngine::compact_messages_intelligently(ConversationHistory& history) {
  return compact(history, config_.max_uncompressed_messages);
}

CompactionResult CompactionEngine::compact_to(ConversationHistory& history, size_t max_entries) {
  return compact(history, std::max<size_t>(2, std::min(max_entries, config_.max_uncompressed_messages)));
}

CompactionResult CompactionEngine::compact(ConversationHistory& history, size_t max_entries) {
  auto start = std::chrono::steady_clock::now();
  std::lock_guard lock(history.mutex_);
  auto& entries = history.entries_;

  CompactionResult result;
  result.messages_processed = entries.size();
  result.original_size = history.memory_usage_locked();

  std::optional<size_t> summary_index;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].is_summary()) {
      summary_index = i;
      break;
    }
  }

  const SummaryPart* old_summary = summary_index ? entries[*summary_index].summary_part() : nullptr;
  size_t old_summary_bytes = summary_index ? entries[*summary_index].byte_size() : 0;

  auto units = build_units(entries);
  auto now = std::chrono::system_clock::now();

  std::vector<bool> evicted(units.size(), false);
  bool any_evicted = false;
  size_t retained_count = entries.size() - (summary_index ? 1 : 0);
  size_t retained_bytes = result.original_size - old_summary_bytes;
  size_t represented = old_summary ? old_summary->represented_bytes : 0;

  auto evict = [&](size_t u) {
    evicted[u] = true;
    any_evicted = true;
    retained_count -= units[u].indices.size();
    retained_bytes -= units[u].bytes;
    represented += units[u].bytes;
  };

  // Upper bound of the size after folding, the summary is capped at kMaxSummaryBytes
  auto over_limits = [&]() {
    bool has_summary = summary_index.has_value() || any_evicted;
    size_t count = retained_count + (has_summary ? 1 : 0);
    size_t bytes = retained_bytes + (has_summary ? std::min(represented, kMaxSummaryBytes) : 0);
    return count > max_entries || bytes > config_.max_memory_bytes;
  };

  // Stale, low-confidence and expired non-critical units always go
  for (size_t u = 0; u < units.size(); ++u) {
    const auto& unit = units[u];
    if (unit.priority == Priority::Critical) continue;
    auto age = now - unit.oldest;
    if (context_confidence(unit.priority) < config_.min_context_confidence || age > config_.max_context_age ||
        age > config_.max_message_age) {
      evict(u);
    }
  }

  // Then ascending priority, oldest first; Critical only as a last resort
  std::vector<size_t> order;
  for (size_t u = 0; u < units.size(); ++u) {
    if (!evicted[u]) order.push_back(u);
  }
  std::stable_sort(order.begin(), order.end(), [&units](size_t a, size_t b) {
    return units[a].priority < units[b].priority;
  });
  for (size_t u : order) {
    if (!over_limits()) break;
    evict(u);
  }

  if (!any_evicted) {
    result.compacted_size = result.original_size;
    result.processing_time = std::chrono::duration_cast<Milliseconds>(std::chrono::steady_clock::now() - start);
    spdlog::debug("[Compaction] Nothing to evict ({} entries, {} bytes)", entries.size(), result.original_size);
    return result;
  }

  // Which entries go, and where the summary lands
  std::vector<bool> drop(entries.size(), false);
  size_t evicted_bytes = 0;
  for (size_t u = 0; u < units.size(); ++u) {
    if (!evicted[u]) continue;
    for (size_t i : units[u].indices) {
      drop[i] = true;
      result.messages_compacted++;
    }
    evicted_bytes += units[u].bytes;
  }
  size_t insert_at = summary_index.value_or(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    if (drop[i]) {
      insert_at = std::min(insert_at, i);
      break;
    }
  }

  // Summary text: header, previous notes, then notes for important evicted messages
  size_t total_compacted = (old_summary ? old_summary->compacted_count : 0) + result.messages_compacted;
  std::string body;
  if (old_summary) {
    auto newline = old_summary->description.find('\n');
    if (newline != std::string::npos) {
      body = old_summary->description.substr(newline + 1);
    }
  }
  std::set<std::string> tools_used;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (!drop[i]) continue;
    const auto& msg = entries[i];
    for (const auto* tc : msg.tool_calls()) {
      tools_used.insert(tc->name);
    }
    if (msg.priority() >= Priority::High) {
      auto snippet = cut_utf8(msg.content_text(), kSnippetBytes);
      std::replace(snippet.begin(), snippet.end(), '\n', ' ');
      body += "- " + to_string(msg.role()) + ": " + snippet + "\n";
    }
  }
  if (!tools_used.empty()) {
    std::string names;
    for (const auto& name : tools_used) {
      names += (names.empty() ? "" : ", ") + name;
    }
    body += "- tools used: " + names + "\n";
  }

  std::string description = "[" + std::to_string(total_compacted) + " earlier messages compacted]\n" + body;
  size_t old_description_size = old_summary ? old_summary->description.size() : 0;
  description = cut_utf8(description, std::min(kMaxSummaryBytes, old_description_size + evicted_bytes));

  auto summary = Message::summary(total_compacted, description, represented);

  std::vector<Message> kept;
  kept.reserve(retained_count + 1);
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i == insert_at) {
      kept.push_back(summary);
    }
    if (drop[i] || (summary_index && i == *summary_index)) continue;
    kept.push_back(std::move(entries[i]));
  }
  entries = std::move(kept);

  history.last_compaction_ = now;
  history.compaction_count_++;
  history.refresh_statistics_locked();

  result.compacted_size = history.memory_usage_locked();
  result.compression_ratio =
      result.original_size == 0 ? 1.0 : static_cast<double>(result.compacted_size) / static_cast<double>(result.original_size);
  result.processing_time = std::chrono::duration_cast<Milliseconds>(std::chrono::steady_clock::now() - start);

  spdlog::info("[Compaction] Folded {} of {} messages, {} -> {} bytes (ratio {:.2f})", result.messages_compacted, result.messages_processed,
               result.original_size, result.compacted_size, result.compression_ratio);
  return result;
}

CompactionStatistics CompactionEngine::get_statistics(const ConversationHistory& history) const {
  return history.statistics();
}

}  // namespace turnloop
