#include "condor/persistence/position_archive.hpp"
#include "condor/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace condor {

namespace fs = std::filesystem;

PositionArchive::PositionArchive(std::string directory)
    : directory_(std::move(directory)) {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create persistence directory " +
                             directory_ + ": " + ec.message());
  }
}

std::string PositionArchive::archivePath() const {
  return (fs::path(directory_) / "positions_archive.jsonl").string();
}

std::string PositionArchive::snapshotPath() const {
  return (fs::path(directory_) / "open_positions.json").string();
}

// -----------------------------------------------------------------------------
// archive(): append one closed Position
// -----------------------------------------------------------------------------
void PositionArchive::archive(const domain::Position& position) {
  const std::string line = nlohmann::json(position).dump();

  std::lock_guard lock(mutex_);
  std::ofstream out(archivePath(), std::ios::out | std::ios::app);
  out << line << '\n';
  out.flush();
  if (!out) {
    std::cerr << "[PositionArchive] ERROR: could not archive " << position.id
              << " to " << archivePath() << "\n";
    return;
  }
  ++archived_;
  std::cout << "[PositionArchive] archived " << position.id
            << " realized_pnl=" << position.realized_pnl << "\n";
}

// -----------------------------------------------------------------------------
// writeOpenSnapshot(): temp file + rename
// -----------------------------------------------------------------------------
void PositionArchive::writeOpenSnapshot(
    const std::vector<domain::Position>& open) {
  const std::string body = nlohmann::json{{"positions", open}}.dump(2);

  std::lock_guard lock(mutex_);
  const std::string final_path = snapshotPath();
  const std::string tmp_path = final_path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    out << body << '\n';
    out.flush();
    if (!out) {
      std::cerr << "[PositionArchive] WARNING: snapshot write failed on "
                << tmp_path << "\n";
      return;
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    std::cerr << "[PositionArchive] WARNING: snapshot rename failed: "
              << ec.message() << "\n";
  }
}

std::size_t PositionArchive::archivedCount() const {
  std::lock_guard lock(mutex_);
  return archived_;
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::vector<domain::Position> PositionArchive::readArchive(
    const std::string& path) {
  std::vector<domain::Position> positions;
  std::ifstream in(path);
  if (!in.is_open()) {
    return positions;
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    try {
      positions.push_back(nlohmann::json::parse(line).get<domain::Position>());
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[PositionArchive] WARNING: skipping malformed archive "
                   "line: "
                << e.what() << "\n";
    }
  }
  return positions;
}

std::vector<domain::Position> PositionArchive::readOpenSnapshot(
    const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return {};
  }
  try {
    nlohmann::json j = nlohmann::json::parse(in);
    return j.at("positions").get<std::vector<domain::Position>>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PositionArchive] WARNING: unreadable snapshot " << path
              << ": " << e.what() << "\n";
    return {};
  }
}

}  // namespace condor
