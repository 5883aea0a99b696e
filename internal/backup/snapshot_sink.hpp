#pragma once

#include <filesystem>
#include <string>

#include "recon/report/v1/report.pb.h"

namespace recon::backup {

/*
  Destination for pre-apply backups.

  Write() must return only after the snapshot is durable; it returns
  a location string recorded in the change-set.
*/
class SnapshotSink {
 public:
  virtual ~SnapshotSink() = default;

  virtual std::string Write(const recon::report::v1::BackupSnapshot& snapshot) = 0;
};

/*
  JSON files named <UTC timestamp>_<run id>.json under one directory.

  Atomic write:
      write tmp -> fsync -> rename -> fsync directory
*/
class FileSnapshotSink final : public SnapshotSink {
 public:
  explicit FileSnapshotSink(std::filesystem::path directory);

  std::string Write(const recon::report::v1::BackupSnapshot& snapshot) override;

  const std::filesystem::path& Directory() const {
    return directory_;
  }

 private:
  std::filesystem::path directory_;
};

} // namespace recon::backup
