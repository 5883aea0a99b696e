#include "snapshot_sink.hpp"

#include <fcntl.h>
#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace recon::backup {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what, const std::filesystem::path& path) {
  throw std::system_error(errno, std::generic_category(), what + " " + path.string());
}

class FileDescriptor {
 public:
  FileDescriptor(const std::filesystem::path& path, int flags, mode_t mode = 0) : fd_(::open(path.c_str(), flags, mode)) {
    if (fd_ < 0) ThrowErrno("open", path);
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  void Close(const std::filesystem::path& path) {
    const int fd = fd_;
    fd_          = -1;
    if (::close(fd) != 0) ThrowErrno("close", path);
  }

 private:
  int fd_;
};

void WriteAll(int fd, const std::string& data, const std::filesystem::path& path) {
  size_t written = 0;
  while (written < data.size()) {
    const auto n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      ThrowErrno("write", path);
    }
    written += static_cast<size_t>(n);
  }
}

} // namespace

FileSnapshotSink::FileSnapshotSink(std::filesystem::path directory) : directory_(std::move(directory)) {
  if (directory_.empty()) {
    throw std::invalid_argument("snapshot directory must not be empty");
  }
  std::filesystem::create_directories(directory_);
}

std::string FileSnapshotSink::Write(const recon::report::v1::BackupSnapshot& snapshot) {
  if (snapshot.run_id().empty() || snapshot.run_id().find('/') != std::string::npos) {
    throw std::invalid_argument("snapshot run id is empty or contains '/'");
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize snapshot: " + std::string(status.message()));
  }

  const auto stamp      = util::CompactUtcStamp(util::Now());
  const auto final_path = directory_ / (stamp + "_" + snapshot.run_id() + ".json");
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  {
    FileDescriptor out(tmp_path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0640);
    WriteAll(out.Get(), json, tmp_path);
    if (::fsync(out.Get()) != 0) ThrowErrno("fsync", tmp_path);
    out.Close(tmp_path);
  }

  std::filesystem::rename(tmp_path, final_path);

  {
    FileDescriptor dir(directory_, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (::fsync(dir.Get()) != 0) ThrowErrno("fsync", directory_);
  }

  RECON_LOG_INFO("backup snapshot written", {observability::StringField("path", final_path.string()),
                                             observability::IntField("rows", snapshot.rows_size())});
  return final_path.string();
}

} // namespace recon::backup
