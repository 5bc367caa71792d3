#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "turnloop/core/types.hpp"

namespace turnloop {

// Blob storage for snapshots, keyed by turn number
class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;

  virtual Status write(TurnNumber turn, const std::string& blob) = 0;

  // NotFound when the turn has no blob
  virtual Result<std::string> read(TurnNumber turn) const = 0;

  // Stored turns, ascending
  virtual std::vector<TurnNumber> list() const = 0;

  virtual Status remove(TurnNumber turn) = 0;

  // Where the blob for a turn lives (file name for directory stores)
  virtual std::string location(TurnNumber turn) const = 0;
};

// One turn_<n>.json file per snapshot, written via temp file + rename
class DirectorySnapshotStore : public SnapshotStore {
 public:
  explicit DirectorySnapshotStore(std::filesystem::path dir);

  Status write(TurnNumber turn, const std::string& blob) override;
  Result<std::string> read(TurnNumber turn) const override;
  std::vector<TurnNumber> list() const override;
  Status remove(TurnNumber turn) override;
  std::string location(TurnNumber turn) const override;

  const std::filesystem::path& directory() const {
    return dir_;
  }

 private:
  std::filesystem::path file_for(TurnNumber turn) const;
  Status atomic_write(const std::filesystem::path& path, const std::string& content);

  std::filesystem::path dir_;
};

class InMemorySnapshotStore : public SnapshotStore {
 public:
  Status write(TurnNumber turn, const std::string& blob) override;
  Result<std::string> read(TurnNumber turn) const override;
  std::vector<TurnNumber> list() const override;
  Status remove(TurnNumber turn) override;
  std::string location(TurnNumber turn) const override;

 private:
  mutable std::mutex mutex_;
  std::map<TurnNumber, std::string> blobs_;
};

}  // namespace turnloop
