#include "turnloop/snapshot/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace turnloop {

namespace fs = std::filesystem;

namespace {

constexpr const char* kPrefix = "turn_";
constexpr const char* kSuffix = ".json";

std::string file_name(TurnNumber turn) {
  return kPrefix + std::to_string(turn) + kSuffix;
}

}  // namespace

// --- DirectorySnapshotStore ---

DirectorySnapshotStore::DirectorySnapshotStore(fs::path dir) : dir_(std::move(dir)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    spdlog::warn("[Snapshot] Failed to create snapshot directory {}: {}", dir_.string(), ec.message());
  }
}

fs::path DirectorySnapshotStore::file_for(TurnNumber turn) const {
  return dir_ / file_name(turn);
}

std::string DirectorySnapshotStore::location(TurnNumber turn) const {
  return file_name(turn);
}

Status DirectorySnapshotStore::atomic_write(const fs::path& path, const std::string& content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::error_code ec;
  fs::create_directories(dir_, ec);

  std::ofstream file(tmp_path, std::ios::trunc | std::ios::binary);
  if (!file.is_open()) {
    return Status::failure(ErrorKind::SnapshotFailure, "Failed to open temp file for writing: " + tmp_path.string());
  }

  file << content;
  file.close();

  if (file.fail()) {
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorKind::SnapshotFailure, "Failed to write temp file: " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    auto message = "Failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message();
    fs::remove(tmp_path, ec);
    return Status::failure(ErrorKind::SnapshotFailure, message);
  }
  return Status::success();
}

Status DirectorySnapshotStore::write(TurnNumber turn, const std::string& blob) {
  return atomic_write(file_for(turn), blob);
}

Result<std::string> DirectorySnapshotStore::read(TurnNumber turn) const {
  auto path = file_for(turn);
  if (!fs::exists(path)) {
    return Result<std::string>::failure(ErrorKind::NotFound, "No snapshot for turn " + std::to_string(turn));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::failure(ErrorKind::SnapshotFailure, "Cannot open " + path.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return Result<std::string>::success(ss.str());
}

std::vector<TurnNumber> DirectorySnapshotStore::list() const {
  std::vector<TurnNumber> turns;
  std::error_code ec;
  if (!fs::is_directory(dir_, ec)) {
    return turns;
  }

  const std::string prefix = kPrefix;
  const std::string suffix = kSuffix;
  for (const auto& entry : fs::directory_iterator(dir_, ec)) {
    auto name = entry.path().filename().string();
    if (!name.starts_with(prefix) || name.size() <= prefix.size() + suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    auto digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    TurnNumber turn = 0;
    auto [end, parse_ec] = std::from_chars(digits.data(), digits.data() + digits.size(), turn);
    if (parse_ec != std::errc() || end != digits.data() + digits.size()) {
      continue;
    }
    turns.push_back(turn);
  }

  std::sort(turns.begin(), turns.end());
  return turns;
}

Status DirectorySnapshotStore::remove(TurnNumber turn) {
  std::error_code ec;
  if (!fs::remove(file_for(turn), ec) && ec) {
    return Status::failure(ErrorKind::SnapshotFailure, "Failed to delete " + file_for(turn).string() + ": " + ec.message());
  }
  return Status::success();
}

// --- InMemorySnapshotStore ---

Status InMemorySnapshotStore::write(TurnNumber turn, const std::string& blob) {
  std::lock_guard lock(mutex_);
  blobs_[turn] = blob;
  return Status::success();
}

Result<std::string> InMemorySnapshotStore::read(TurnNumber turn) const {
  std::lock_guard lock(mutex_);
  auto it = blobs_.find(turn);
  if (it == blobs_.end()) {
    return Result<std::string>::failure(ErrorKind::NotFound, "No snapshot for turn " + std::to_string(turn));
  }
  return Result<std::string>::success(it->second);
}

std::vector<TurnNumber> InMemorySnapshotStore::list() const {
  std::lock_guard lock(mutex_);
  std::vector<TurnNumber> turns;
  turns.reserve(blobs_.size());
  for (const auto& [turn, blob] : blobs_) {
    turns.push_back(turn);
  }
  return turns;
}

Status InMemorySnapshotStore::remove(TurnNumber turn) {
  std::lock_guard lock(mutex_);
  blobs_.erase(turn);
  return Status::success();
}

std::string InMemorySnapshotStore::location(TurnNumber turn) const {
  return file_name(turn);
}

}  // namespace turnloop
