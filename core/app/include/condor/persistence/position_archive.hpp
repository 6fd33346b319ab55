#pragma once

#include "condor/domain/position.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace condor {

// -----------------------------------------------------------------------------
// PositionArchive
// -----------------------------------------------------------------------------
//
// @brief  Durable record of Positions: closed ones appended to
//         <dir>/positions_archive.jsonl, open ones mirrored in
//         <dir>/open_positions.json.
//
// @details
// The open snapshot is rewritten whole on every Position change (write to a
// temporary file, then rename over the old one), so a crash leaves either
// the previous or the new snapshot, never a torn one. It is best-effort:
// a failed write is logged, not thrown.
//
// Both files are write-only while the engine runs and are read back by
// JournalReconciler at the next startup.
//
// Thread-safety: all writers lock an internal mutex.
// -----------------------------------------------------------------------------
class PositionArchive {
 public:
  // Creates `directory` if needed. Throws std::runtime_error if it cannot.
  explicit PositionArchive(std::string directory);

  PositionArchive(const PositionArchive&) = delete;
  PositionArchive& operator=(const PositionArchive&) = delete;

  void archive(const domain::Position& position);

  void writeOpenSnapshot(const std::vector<domain::Position>& open);

  std::size_t archivedCount() const;

  const std::string& directory() const { return directory_; }
  std::string archivePath() const;
  std::string snapshotPath() const;

  static std::vector<domain::Position> readArchive(const std::string& path);
  static std::vector<domain::Position> readOpenSnapshot(
      const std::string& path);

 private:
  std::string directory_;
  mutable std::mutex mutex_;
  std::size_t archived_{0};
};

}  // namespace condor
