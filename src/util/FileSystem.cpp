// Repository: Retrovue-vqexec
// Component: Filesystem Helpers
// Purpose: Path, directory, glob and named-pipe helpers over POSIX and
//          std::filesystem.
// Copyright (c) 2026 RetroVue

#include "vqexec/util/FileSystem.hpp"

#include <fcntl.h>
#include <glob.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <regex>
#include <system_error>

#include "vqexec/core/Errors.hpp"

namespace vqexec::util {

namespace fs = std::filesystem;

namespace {

std::string ErrnoDetail(const std::string& op, const std::string& path, int err) {
  return op + " " + path + ": " + std::strerror(err);
}

}  // namespace

bool PathExists(const std::string& path) {
  struct stat st;
  return lstat(path.c_str(), &st) == 0;
}

bool IsFifo(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) return false;
  return S_ISFIFO(st.st_mode);
}

bool MatchAnyFiles(const std::string& pattern) {
  if (PathExists(pattern)) return true;

  static const std::regex kPrintfFrame("%0?[0-9]*d");
  const std::string glob_pattern = std::regex_replace(pattern, kPrintfFrame, "*");

  glob_t matches;
  std::memset(&matches, 0, sizeof(matches));
  const int rc = glob(glob_pattern.c_str(), 0, nullptr, &matches);
  const bool found = (rc == 0 && matches.gl_pathc > 0);
  globfree(&matches);
  return found;
}

void RemoveIfExists(const std::string& path) {
  if (unlink(path.c_str()) == 0) return;
  if (errno == ENOENT) return;
  throw core::IoError(ErrnoDetail("unlink", path, errno));
}

void MakeDirs(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw core::IoError("create_directories " + path + ": " + ec.message());
  }
}

void MakeParentDirs(const std::string& path) {
  MakeDirs(DirName(path));
}

bool RemoveDirIfEmpty(const std::string& path) {
  if (rmdir(path.c_str()) == 0) return true;
  if (errno == ENOTEMPTY || errno == EEXIST || errno == ENOENT) {
    return false;
  }
  throw core::IoError(ErrnoDetail("rmdir", path, errno));
}

void MakeFifo(const std::string& path) {
  if (mkfifo(path.c_str(), 0644) != 0) {
    throw core::IoError(ErrnoDetail("mkfifo", path, errno));
  }
}

void PokeFifo(const std::string& path) {
  if (!IsFifo(path)) return;
  // O_RDWR on a FIFO never blocks on Linux and counts as both a reader and a
  // writer, so a peer stuck in open() on either side proceeds.
  const int fd = open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd >= 0) {
    close(fd);
  }
}

std::string BaseName(const std::string& path) {
  return fs::path(path).filename().string();
}

std::string DirName(const std::string& path) {
  return fs::path(path).parent_path().string();
}

std::string FileExtension(const std::string& path) {
  std::string ext = fs::path(path).extension().string();
  if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace vqexec::util
