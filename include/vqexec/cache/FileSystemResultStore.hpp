// Repository: Retrovue-vqexec
// Component: Filesystem Result Store
// Purpose: IResultStore backed by a directory tree of protobuf records and
//          gzip-compressed workfile snapshots.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CACHE_FILE_SYSTEM_RESULT_STORE_HPP_
#define VQEXEC_CACHE_FILE_SYSTEM_RESULT_STORE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "vqexec/cache/IResultStore.hpp"

namespace vqexec::cache {

// Layout under root:
//
//   {root}/{executor_id}/{fingerprint}.result.pb      ResultRecord
//   {root}/{executor_id}/{fingerprint}_{role}.yuv.gz  workfile snapshot
//   {root}/{executor_id}/{fingerprint}.lock           compute lease (flock)
//
// Records are written to a temporary sibling and renamed into place, so a
// reader never sees a partial record.
class FileSystemResultStore : public IResultStore {
 public:
  explicit FileSystemResultStore(std::string root);

  std::optional<core::Result> Load(const asset::Asset& a,
                                   const std::string& executor_id) override;
  void Save(const core::Result& result) override;
  void Delete(const asset::Asset& a, const std::string& executor_id) override;

  void SaveWorkfile(const core::Result& result, const std::string& path,
                    asset::StreamRole role) override;
  void DeleteWorkfile(const asset::Asset& a, const std::string& executor_id,
                      asset::StreamRole role) override;

  std::unique_ptr<ComputeLease> AcquireComputeLease(
      const asset::Asset& a, const std::string& executor_id) override;

  const std::string& root() const { return root_; }

  std::string RecordPath(const asset::Asset& a, const std::string& executor_id) const;
  std::string WorkfilePath(const asset::Asset& a, const std::string& executor_id,
                           asset::StreamRole role) const;
  std::string LockPath(const asset::Asset& a, const std::string& executor_id) const;

 private:
  std::string ExecutorDir(const std::string& executor_id) const;
  std::string TempPathFor(const std::string& path);

  std::string root_;
  std::atomic<uint64_t> temp_counter_{0};
};

}  // namespace vqexec::cache

#endif  // VQEXEC_CACHE_FILE_SYSTEM_RESULT_STORE_HPP_
