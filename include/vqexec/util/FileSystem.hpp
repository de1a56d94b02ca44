// Repository: Retrovue-vqexec
// Component: Filesystem Helpers
// Purpose: Path probes and removals used by stage teardown and cleanup.
//          Named pipes count as existing paths everywhere.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_UTIL_FILE_SYSTEM_HPP_
#define VQEXEC_UTIL_FILE_SYSTEM_HPP_

#include <string>

namespace vqexec::util {

// True if anything (file, directory, FIFO) exists at path. Does not follow
// a dangling symlink.
bool PathExists(const std::string& path);

bool IsFifo(const std::string& path);

// True if `pattern` names an existing path, or expands (glob, with printf
// "%d"/"%0Nd" frame placeholders treated as "*") to at least one file.
// Used for image-sequence sources such as "frame_%08d.tiff".
bool MatchAnyFiles(const std::string& pattern);

// Removes a file or FIFO. Missing path is not an error.
// Throws core::IoError on any other failure.
void RemoveIfExists(const std::string& path);

// mkdir -p. Throws core::IoError.
void MakeDirs(const std::string& path);
void MakeParentDirs(const std::string& path);

// rmdir that tolerates "directory not empty" and "no such directory".
// Returns true only when the directory was removed.
bool RemoveDirIfEmpty(const std::string& path);

// mkfifo(path, 0644). Throws core::IoError (including when path exists).
void MakeFifo(const std::string& path);

// Opens and immediately closes a FIFO in non-blocking read-write mode.
// Wakes a peer blocked in open() on either end. No-op on non-FIFO paths.
void PokeFifo(const std::string& path);

std::string BaseName(const std::string& path);
std::string DirName(const std::string& path);

// Lowercased extension without the dot ("" when none).
std::string FileExtension(const std::string& path);

}  // namespace vqexec::util

#endif  // VQEXEC_UTIL_FILE_SYSTEM_HPP_
