#include "remote/mute_store.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "common/logging/logger.h"

namespace tvlink::remote {

namespace {
constexpr const char* kMutedKey = "muted";

std::string trim(const std::string& str) {
  const auto start = str.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(start, end - start + 1);
}
}  // namespace

MuteStore::MuteStore(std::string path) : path_(std::move(path)) {}

bool MuteStore::load() {
  muted_ = false;
  if (path_.empty()) {
    return muted_;
  }

  std::ifstream file(path_);
  if (!file) {
    LOG_DEBUG("No mute state at {}, assuming unmuted", path_);
    return muted_;
  }

  std::string line;
  while (std::getline(file, line)) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    if (trim(line.substr(0, eq)) == kMutedKey) {
      muted_ = trim(line.substr(eq + 1)) == "true";
    }
  }
  LOG_DEBUG("Loaded mute state from {}: {}", path_, muted_);
  return muted_;
}

void MuteStore::set_muted(bool muted) {
  muted_ = muted;
  if (!path_.empty() && !save()) {
    LOG_WARN("Failed to persist mute state to {}", path_);
  }
}

bool MuteStore::toggle() {
  set_muted(!muted_);
  return muted_;
}

bool MuteStore::save() const {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::path target(path_);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      LOG_DEBUG("Cannot create {}: {}", target.parent_path().string(), ec.message());
      return false;
    }
  }

  // Write a sibling file and rename it over the old one.
  const fs::path temp = fs::path(path_ + ".tmp");
  {
    std::ofstream file(temp, std::ios::trunc);
    if (!file) {
      return false;
    }
    file << kMutedKey << '=' << (muted_ ? "true" : "false") << '\n';
    if (!file.flush()) {
      return false;
    }
  }
  fs::rename(temp, target, ec);
  if (ec) {
    LOG_DEBUG("Cannot replace {}: {}", path_, ec.message());
    fs::remove(temp, ec);
    return false;
  }
  return true;
}

}  // namespace tvlink::remote
