#pragma once

#include <memory>
#include <string>
#include <vector>

#include "turnloop/core/config.hpp"
#include "turnloop/core/types.hpp"
#include "turnloop/snapshot/store.hpp"

namespace turnloop {

struct Snapshot {
  TurnNumber turn_number = 0;
  Timestamp created_at;
  size_t size_bytes = 0;
  std::string filename;
  json metadata = json::object();
  std::string checksum;  // SHA-256 of the serialized state, hex
};

// Point-in-time session state, one per turn
class SnapshotManager {
 public:
  SnapshotManager(SnapshotConfig config, std::shared_ptr<SnapshotStore> store);

  // Directory store when config.directory is set, in-memory otherwise
  static std::shared_ptr<SnapshotStore> make_store(const SnapshotConfig& config);

  // Stores state for the turn, replacing any earlier snapshot of it; prunes when auto_cleanup is on
  Result<Snapshot> save(TurnNumber turn, const json& state, const json& metadata = json::object());

  // Ascending turn order; unreadable entries are skipped
  std::vector<Snapshot> list() const;

  // Deletes the oldest snapshots beyond max_snapshots; returns how many were removed
  Result<size_t> cleanup(size_t max_snapshots);

  // NotFound if missing, SnapshotFailure if the stored state fails verification
  Result<json> load(TurnNumber turn) const;

  bool enabled() const {
    return config_.enabled;
  }

  const SnapshotConfig& config() const {
    return config_;
  }

 private:
  Result<json> read_envelope(TurnNumber turn) const;

  SnapshotConfig config_;
  std::shared_ptr<SnapshotStore> store_;
};

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

}  // namespace turnloop
