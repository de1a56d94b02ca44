// Repository: Retrovue-vqexec
// Component: In-Memory Result Store
// Purpose: IResultStore keyed by (executor id, asset string) for executor
//          contract tests. Counts calls; workfile snapshots keep their size.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_TESTS_FIXTURES_IN_MEMORY_RESULT_STORE_H_
#define VQEXEC_TESTS_FIXTURES_IN_MEMORY_RESULT_STORE_H_

#include <sys/stat.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "vqexec/cache/IResultStore.hpp"
#include "vqexec/core/Errors.hpp"

namespace vqexec::tests::fixtures {

class InMemoryResultStore : public cache::IResultStore {
 public:
  std::optional<core::Result> Load(const asset::Asset& a,
                                   const std::string& executor_id) override {
    load_calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find({executor_id, a.ToString()});
    if (it == results_.end()) return std::nullopt;
    return it->second;
  }

  void Save(const core::Result& result) override {
    save_calls_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    results_.insert_or_assign({result.executor_id(), result.asset().ToString()}, result);
  }

  void Delete(const asset::Asset& a, const std::string& executor_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.erase({executor_id, a.ToString()});
  }

  void SaveWorkfile(const core::Result& result, const std::string& path,
                    asset::StreamRole role) override {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      throw core::IoError("workfile snapshot source is not a regular file: " + path);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workfiles_[WorkfileKey(result.asset(), result.executor_id(), role)] =
        static_cast<int64_t>(st.st_size);
  }

  void DeleteWorkfile(const asset::Asset& a, const std::string& executor_id,
                      asset::StreamRole role) override {
    std::lock_guard<std::mutex> lock(mutex_);
    workfiles_.erase(WorkfileKey(a, executor_id, role));
  }

  bool Contains(const asset::Asset& a, const std::string& executor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.count({executor_id, a.ToString()}) != 0;
  }

  // Snapshot size in bytes, or -1 when none was saved.
  int64_t WorkfileSize(const asset::Asset& a, const std::string& executor_id,
                       asset::StreamRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workfiles_.find(WorkfileKey(a, executor_id, role));
    return it == workfiles_.end() ? -1 : it->second;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
  }

  int load_calls() const { return load_calls_.load(); }
  int save_calls() const { return save_calls_.load(); }

 private:
  using Key = std::pair<std::string, std::string>;

  static std::string WorkfileKey(const asset::Asset& a, const std::string& executor_id,
                                 asset::StreamRole role) {
    return executor_id + "|" + a.ToString() + "|" + asset::StreamRoleName(role);
  }

  mutable std::mutex mutex_;
  std::map<Key, core::Result> results_;         // Guarded by mutex_
  std::map<std::string, int64_t> workfiles_;    // Guarded by mutex_
  std::atomic<int> load_calls_{0};
  std::atomic<int> save_calls_{0};
};

}  // namespace vqexec::tests::fixtures

#endif  // VQEXEC_TESTS_FIXTURES_IN_MEMORY_RESULT_STORE_H_
