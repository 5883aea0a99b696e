#include "internal/backup/snapshot_sink.hpp"

#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace {

using namespace recon;
namespace report = recon::report::v1;

std::filesystem::path ScratchDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("recon_" + name + "_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  return dir;
}

report::BackupSnapshot MakeSnapshot(const std::string& run_id) {
  report::BackupSnapshot snapshot;
  snapshot.set_snapshot_id("snap-1");
  snapshot.set_run_id(run_id);
  *snapshot.mutable_taken_at() = util::ToProto(util::Now());

  auto* row = snapshot.add_rows();
  row->set_table("bookings");
  row->set_key("id=X");
  row->set_existed_before(true);
  row->set_exists_after(true);
  (*row->mutable_before()->mutable_fields())["paid_cents"].set_number_value(0);
  (*row->mutable_after()->mutable_fields())["paid_cents"].set_number_value(50000);
  return snapshot;
}

void TestWriteIsReadableAndComplete() {
  const auto              dir = ScratchDir("snapshot_sink");
  backup::FileSnapshotSink sink(dir);
  assert(std::filesystem::is_directory(dir));

  const auto location = sink.Write(MakeSnapshot("run-42"));
  const auto path     = std::filesystem::path(location);

  assert(path.parent_path() == dir);
  assert(path.extension() == ".json");
  assert(path.filename().string().find("_run-42.json") != std::string::npos);

  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    assert(entry.path().extension() != ".tmp");
  }

  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();

  report::BackupSnapshot restored;
  const auto             status = google::protobuf::util::JsonStringToMessage(buffer.str(), &restored);
  assert(status.ok());
  assert(restored.run_id() == "run-42");
  assert(restored.rows_size() == 1);
  assert(restored.rows(0).key() == "id=X");
  assert(restored.rows(0).before().fields().at("paid_cents").number_value() == 0);
  assert(buffer.str().find("\"existed_before\"") != std::string::npos);

  std::filesystem::remove_all(dir);
}

void TestRejectsBadInput() {
  bool empty_dir = false;
  try {
    backup::FileSnapshotSink sink{std::filesystem::path{}};
  } catch (const std::invalid_argument&) {
    empty_dir = true;
  }
  assert(empty_dir);

  const auto               dir = ScratchDir("snapshot_sink_bad");
  backup::FileSnapshotSink sink(dir);

  for (const std::string run_id : {"", "../escape"}) {
    bool rejected = false;
    try {
      sink.Write(MakeSnapshot(run_id));
    } catch (const std::invalid_argument&) {
      rejected = true;
    }
    assert(rejected);
  }
  assert(std::filesystem::is_empty(dir));

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestWriteIsReadableAndComplete();
  TestRejectsBadInput();

  std::cout << "recon_unit_snapshot_sink: pass\n";
  return 0;
}
