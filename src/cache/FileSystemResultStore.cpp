// Repository: Retrovue-vqexec
// Component: Filesystem Result Store
// Purpose: Persist results as protobuf records on disk, keyed by asset
//          fingerprint and executor id, with file locking.
// Copyright (c) 2026 RetroVue

#include "vqexec/cache/FileSystemResultStore.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <zlib.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

#include "result_record.pb.h"
#include "vqexec/core/Errors.hpp"
#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::cache {

namespace {

constexpr uint32_t kRecordFormatVersion = 1;
constexpr size_t kCopyChunkBytes = 1 << 20;

int64_t NowUnixMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void RenameInto(const std::string& tmp, const std::string& dest) {
  if (std::rename(tmp.c_str(), dest.c_str()) != 0) {
    const std::string reason = std::strerror(errno);
    std::remove(tmp.c_str());
    throw core::IoError("rename " + tmp + " -> " + dest + " failed: " + reason);
  }
}

// flock(2) on a per-(asset, executor) lock file. Serializes threads as well
// as processes: each lease opens its own file description.
class FlockLease : public ComputeLease {
 public:
  explicit FlockLease(int fd) : fd_(fd) {}
  ~FlockLease() override {
    flock(fd_, LOCK_UN);
    close(fd_);
  }

 private:
  int fd_;
};

}  // namespace

FileSystemResultStore::FileSystemResultStore(std::string root) : root_(std::move(root)) {
  if (root_.empty()) {
    throw core::ConfigurationError("result store root is empty");
  }
}

std::string FileSystemResultStore::ExecutorDir(const std::string& executor_id) const {
  return root_ + "/" + executor_id;
}

std::string FileSystemResultStore::RecordPath(const asset::Asset& a,
                                              const std::string& executor_id) const {
  return ExecutorDir(executor_id) + "/" + a.Fingerprint() + ".result.pb";
}

std::string FileSystemResultStore::WorkfilePath(const asset::Asset& a,
                                                const std::string& executor_id,
                                                asset::StreamRole role) const {
  return ExecutorDir(executor_id) + "/" + a.Fingerprint() + "_" +
         asset::StreamRoleName(role) + ".yuv.gz";
}

std::string FileSystemResultStore::LockPath(const asset::Asset& a,
                                            const std::string& executor_id) const {
  return ExecutorDir(executor_id) + "/" + a.Fingerprint() + ".lock";
}

std::string FileSystemResultStore::TempPathFor(const std::string& path) {
  return path + ".tmp." + std::to_string(getpid()) + "." +
         std::to_string(temp_counter_.fetch_add(1));
}

std::optional<core::Result> FileSystemResultStore::Load(const asset::Asset& a,
                                                        const std::string& executor_id) {
  const std::string path = RecordPath(a, executor_id);
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  ResultRecord record;
  if (!record.ParseFromIstream(&in)) {
    util::Logger::Warn("[FileSystemResultStore] CORRUPT_RECORD path=" + path);
    return std::nullopt;
  }
  if (record.format_version() != kRecordFormatVersion ||
      record.executor_id() != executor_id || record.asset_repr() != a.ToString()) {
    util::Logger::Warn("[FileSystemResultStore] RECORD_MISMATCH path=" + path +
                       " stored_executor=" + record.executor_id());
    return std::nullopt;
  }

  core::ScoreMap scores;
  for (const auto& [key, series] : record.scores()) {
    scores[key].assign(series.values().begin(), series.values().end());
  }
  return core::Result(a, executor_id, std::move(scores));
}

void FileSystemResultStore::Save(const core::Result& result) {
  const asset::Asset& a = result.asset();
  const std::string path = RecordPath(a, result.executor_id());
  util::MakeParentDirs(path);

  ResultRecord record;
  record.set_format_version(kRecordFormatVersion);
  record.set_executor_id(result.executor_id());
  record.set_asset_repr(a.ToString());
  record.set_asset_fingerprint(a.Fingerprint());
  record.set_created_unix_ms(NowUnixMs());
  auto* scores = record.mutable_scores();
  for (const auto& [key, series] : result.scores()) {
    ScoreSeries& out = (*scores)[key];
    out.mutable_values()->Reserve(static_cast<int>(series.size()));
    for (double v : series) out.add_values(v);
  }

  const std::string tmp = TempPathFor(path);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out || !record.SerializeToOstream(&out)) {
      std::remove(tmp.c_str());
      throw core::IoError("failed to write result record " + tmp);
    }
    out.flush();
    if (!out) {
      std::remove(tmp.c_str());
      throw core::IoError("failed to flush result record " + tmp);
    }
  }
  RenameInto(tmp, path);
  util::Logger::Debug("[FileSystemResultStore] SAVED path=" + path);
}

void FileSystemResultStore::Delete(const asset::Asset& a, const std::string& executor_id) {
  util::RemoveIfExists(RecordPath(a, executor_id));
}

void FileSystemResultStore::SaveWorkfile(const core::Result& result,
                                         const std::string& path,
                                         asset::StreamRole role) {
  const std::string dest = WorkfilePath(result.asset(), result.executor_id(), role);
  util::MakeParentDirs(dest);

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw core::IoError("cannot open workfile " + path + " for snapshot");
  }

  const std::string tmp = TempPathFor(dest);
  gzFile gz = gzopen(tmp.c_str(), "wb");
  if (gz == nullptr) {
    throw core::IoError("gzopen failed for " + tmp);
  }

  std::vector<char> chunk(kCopyChunkBytes);
  bool ok = true;
  while (ok && in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const std::streamsize n = in.gcount();
    if (n > 0 && gzwrite(gz, chunk.data(), static_cast<unsigned>(n)) != n) {
      ok = false;
    }
  }
  if (in.bad()) ok = false;
  if (gzclose(gz) != Z_OK) ok = false;
  if (!ok) {
    std::remove(tmp.c_str());
    throw core::IoError("failed to snapshot workfile " + path + " into " + dest);
  }
  RenameInto(tmp, dest);
  util::Logger::Debug("[FileSystemResultStore] WORKFILE_SAVED role=" +
                      std::string(asset::StreamRoleName(role)) + " path=" + dest);
}

void FileSystemResultStore::DeleteWorkfile(const asset::Asset& a,
                                           const std::string& executor_id,
                                           asset::StreamRole role) {
  util::RemoveIfExists(WorkfilePath(a, executor_id, role));
}

std::unique_ptr<ComputeLease> FileSystemResultStore::AcquireComputeLease(
    const asset::Asset& a, const std::string& executor_id) {
  const std::string path = LockPath(a, executor_id);
  util::MakeParentDirs(path);

  const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw core::IoError("cannot open lease " + path + ": " + std::strerror(errno));
  }
  while (flock(fd, LOCK_EX) != 0) {
    if (errno == EINTR) continue;
    const std::string reason = std::strerror(errno);
    close(fd);
    throw core::IoError("flock failed on " + path + ": " + reason);
  }
  return std::make_unique<FlockLease>(fd);
}

}  // namespace vqexec::cache
