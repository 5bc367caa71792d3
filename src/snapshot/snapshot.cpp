#include "turnloop/snapshot/snapshot.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <cstdio>

namespace turnloop {

std::string sha256_hex(const std::string& data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

  std::string hex;
  hex.reserve(SHA256_DIGEST_LENGTH * 2);
  char buf[3];
  for (unsigned char byte : hash) {
    std::snprintf(buf, sizeof(buf), "%02x", byte);
    hex += buf;
  }
  return hex;
}

SnapshotManager::SnapshotManager(SnapshotConfig config, std::shared_ptr<SnapshotStore> store)
    : config_(std::move(config)), store_(std::move(store)) {}

std::shared_ptr<SnapshotStore> SnapshotManager::make_store(const SnapshotConfig& config) {
  if (config.directory.empty()) {
    return std::make_shared<InMemorySnapshotStore>();
  }
  return std::make_shared<DirectorySnapshotStore>(config.directory);
}

Result<Snapshot> SnapshotManager::save(TurnNumber turn, const json& state, const json& metadata) {
  std::string serialized_state;
  try {
    serialized_state = state.dump();
  } catch (const json::exception& e) {
    spdlog::warn("[Snapshot] Cannot serialize state of turn {}: {}", turn, e.what());
    return Result<Snapshot>::failure(ErrorKind::SnapshotFailure, std::string("Cannot serialize snapshot: ") + e.what());
  }

  Snapshot snapshot;
  snapshot.turn_number = turn;
  snapshot.created_at = std::chrono::system_clock::now();
  snapshot.filename = store_->location(turn);
  snapshot.metadata = metadata.is_null() ? json::object() : metadata;
  snapshot.checksum = sha256_hex(serialized_state);

  json envelope;
  envelope["turn_number"] = turn;
  envelope["created_at"] = to_epoch_seconds(snapshot.created_at);
  envelope["metadata"] = snapshot.metadata;
  envelope["checksum"] = snapshot.checksum;
  envelope["state"] = state;

  std::string blob;
  try {
    blob = envelope.dump(2);
  } catch (const json::exception& e) {
    return Result<Snapshot>::failure(ErrorKind::SnapshotFailure, std::string("Cannot serialize snapshot: ") + e.what());
  }
  snapshot.size_bytes = blob.size();

  auto status = store_->write(turn, blob);
  if (!status.ok()) {
    spdlog::warn("[Snapshot] Failed to save turn {}: {}", turn, status.error->message);
    return Result<Snapshot>::failure(ErrorKind::SnapshotFailure, status.error->message);
  }
  spdlog::debug("[Snapshot] Saved turn {} ({} bytes)", turn, snapshot.size_bytes);

  if (config_.auto_cleanup) {
    auto removed = cleanup(config_.max_snapshots);
    if (removed.failed()) {
      spdlog::warn("[Snapshot] Cleanup after turn {} failed: {}", turn, removed.message());
    }
  }

  return Result<Snapshot>::success(std::move(snapshot));
}

Result<json> SnapshotManager::read_envelope(TurnNumber turn) const {
  auto blob = store_->read(turn);
  if (blob.failed()) {
    return Result<json>::failure(blob.kind(), blob.message());
  }

  try {
    auto envelope = json::parse(*blob.value);
    if (!envelope.is_object() || !envelope.contains("state") || !envelope.contains("checksum")) {
      return Result<json>::failure(ErrorKind::SnapshotFailure, "Snapshot for turn " + std::to_string(turn) + " is incomplete");
    }
    return Result<json>::success(std::move(envelope));
  } catch (const json::parse_error& e) {
    return Result<json>::failure(ErrorKind::SnapshotFailure, "Snapshot for turn " + std::to_string(turn) + " is corrupt: " + e.what());
  }
}

std::vector<Snapshot> SnapshotManager::list() const {
  std::vector<Snapshot> snapshots;
  for (auto turn : store_->list()) {
    auto envelope = read_envelope(turn);
    if (envelope.failed()) {
      spdlog::warn("[Snapshot] Skipping turn {}: {}", turn, envelope.message());
      continue;
    }
    const auto& e = *envelope.value;

    Snapshot snapshot;
    snapshot.turn_number = turn;
    snapshot.created_at = from_epoch_seconds(e.value("created_at", int64_t(0)));
    snapshot.size_bytes = e.dump(2).size();
    snapshot.filename = store_->location(turn);
    snapshot.metadata = e.value("metadata", json::object());
    snapshot.checksum = e.value("checksum", "");
    snapshots.push_back(std::move(snapshot));
  }
  return snapshots;
}

Result<size_t> SnapshotManager::cleanup(size_t max_snapshots) {
  auto turns = store_->list();
  if (turns.size() <= max_snapshots) {
    return Result<size_t>::success(0);
  }

  size_t excess = turns.size() - max_snapshots;
  for (size_t i = 0; i < excess; ++i) {
    auto status = store_->remove(turns[i]);
    if (!status.ok()) {
      return Result<size_t>::failure(ErrorKind::SnapshotFailure, status.error->message);
    }
  }
  spdlog::debug("[Snapshot] Removed {} old snapshot(s), keeping {}", excess, max_snapshots);
  return Result<size_t>::success(excess);
}

Result<json> SnapshotManager::load(TurnNumber turn) const {
  auto envelope = read_envelope(turn);
  if (envelope.failed()) {
    return envelope;
  }

  const auto& e = *envelope.value;
  if (!e["checksum"].is_string() || sha256_hex(e["state"].dump()) != e["checksum"].get<std::string>()) {
    spdlog::error("[Snapshot] Checksum mismatch for turn {}", turn);
    return Result<json>::failure(ErrorKind::SnapshotFailure, "Checksum mismatch for turn " + std::to_string(turn));
  }
  return Result<json>::success(e["state"]);
}

}  // namespace turnloop
