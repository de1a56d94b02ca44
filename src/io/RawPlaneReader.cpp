// Repository: Retrovue-vqexec
// Component: Raw Plane Reader / Writer
// Purpose: Frame-at-a-time reading and writing of raw planar video as
//          normalized float planes.
// Copyright (c) 2026 RetroVue

#include "vqexec/io/RawPlaneReader.hpp"

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <ctime>

#include "vqexec/core/Errors.hpp"

namespace vqexec::io {

namespace {

std::string ErrnoText(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

// Blocks SIGPIPE for the calling thread for the guard's lifetime. A write to
// a reader-less pipe then fails with EPIPE instead of killing the process;
// the pending signal it raised is consumed before the old mask is restored.
class ScopedSigpipeBlock {
 public:
  ScopedSigpipeBlock() {
    sigemptyset(&pipe_set_);
    sigaddset(&pipe_set_, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_);
  }

  ~ScopedSigpipeBlock() {
    if (got_epipe_ && !was_pending_) {
      const struct timespec zero = {0, 0};
      while (sigtimedwait(&pipe_set_, nullptr, &zero) < 0 && errno == EINTR) {
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  }

  void NoteEpipe() { got_epipe_ = true; }

 private:
  sigset_t pipe_set_;
  sigset_t old_mask_;
  bool was_pending_ = false;
  bool got_epipe_ = false;
};

// Little-endian sample at byte offset.
inline int LoadSample(const uint8_t* p, int bytes_per_sample) {
  if (bytes_per_sample == 1) return p[0];
  return static_cast<int>(p[0]) | (static_cast<int>(p[1]) << 8);
}

inline void StoreSample(uint8_t* p, int bytes_per_sample, int value) {
  p[0] = static_cast<uint8_t>(value & 0xff);
  if (bytes_per_sample == 2) {
    p[1] = static_cast<uint8_t>((value >> 8) & 0xff);
  }
}

}  // namespace

// =============================================================================
// RawPlaneReader
// =============================================================================

RawPlaneReader::RawPlaneReader(const std::string& path, PixelFormat format,
                               int width, int height)
    : path_(path), format_(std::move(format)), width_(width), height_(height) {
  do {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd_ < 0 && errno == EINTR);
  if (fd_ < 0) {
    throw core::IoError(ErrnoText("cannot open for reading", path_));
  }
  buffer_.resize(format_.FrameBytes(width_, height_));
}

RawPlaneReader::~RawPlaneReader() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

bool RawPlaneReader::Next(PlanarFrame& frame) {
  size_t filled = 0;
  while (filled < buffer_.size()) {
    const ssize_t n = ::read(fd_, buffer_.data() + filled, buffer_.size() - filled);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw core::IoError(ErrnoText("read failed on", path_));
    }
    if (n == 0) break;
    filled += static_cast<size_t>(n);
  }

  if (filled == 0) return false;
  if (filled < buffer_.size()) {
    throw core::IoError("truncated frame " + std::to_string(frames_read_) + " in " +
                        path_ + ": got " + std::to_string(filled) + " of " +
                        std::to_string(buffer_.size()) + " bytes");
  }

  const int bps = format_.bytes_per_sample();
  const float scale = 1.0f / static_cast<float>(format_.max_value());
  FloatPlane* planes[3] = {&frame.y, &frame.u, &frame.v};
  const uint8_t* src = buffer_.data();
  for (int p = 0; p < 3; ++p) {
    if (p >= format_.plane_count()) {
      planes[p]->Resize(0, 0);
      continue;
    }
    const int w = format_.PlaneWidth(p, width_);
    const int h = format_.PlaneHeight(p, height_);
    planes[p]->Resize(w, h);
    for (float& s : planes[p]->samples) {
      s = static_cast<float>(LoadSample(src, bps)) * scale;
      src += bps;
    }
  }

  ++frames_read_;
  return true;
}

// =============================================================================
// RawPlaneWriter
// =============================================================================

RawPlaneWriter::RawPlaneWriter(const std::string& path, PixelFormat format,
                               int width, int height)
    : path_(path), format_(std::move(format)), width_(width), height_(height) {
  do {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  } while (fd_ < 0 && errno == EINTR);
  if (fd_ < 0) {
    throw core::IoError(ErrnoText("cannot open for writing", path_));
  }
  buffer_.resize(format_.FrameBytes(width_, height_));
}

RawPlaneWriter::~RawPlaneWriter() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

void RawPlaneWriter::Write(const PlanarFrame& frame) {
  if (fd_ < 0) {
    throw core::IoError("write after close on " + path_);
  }

  const int bps = format_.bytes_per_sample();
  const int max_value = format_.max_value();
  const FloatPlane* planes[3] = {&frame.y, &frame.u, &frame.v};
  uint8_t* dst = buffer_.data();
  for (int p = 0; p < format_.plane_count(); ++p) {
    const int w = format_.PlaneWidth(p, width_);
    const int h = format_.PlaneHeight(p, height_);
    const FloatPlane& plane = *planes[p];
    if (plane.width != w || plane.height != h) {
      throw core::IoError("plane " + std::to_string(p) + " is " +
                          std::to_string(plane.width) + "x" +
                          std::to_string(plane.height) + ", expected " +
                          std::to_string(w) + "x" + std::to_string(h) +
                          " writing " + path_);
    }
    for (float s : plane.samples) {
      const float clamped = std::min(1.0f, std::max(0.0f, s));
      StoreSample(dst, bps,
                  static_cast<int>(std::lround(clamped * static_cast<float>(max_value))));
      dst += bps;
    }
  }

  ScopedSigpipeBlock sigpipe_guard;
  size_t written = 0;
  while (written < buffer_.size()) {
    const ssize_t n = ::write(fd_, buffer_.data() + written, buffer_.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EPIPE) sigpipe_guard.NoteEpipe();
      throw core::IoError(ErrnoText("write failed on", path_));
    }
    written += static_cast<size_t>(n);
  }
  ++frames_written_;
}

void RawPlaneWriter::Close() {
  if (fd_ < 0) return;
  const int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0 && errno != EINTR) {
    throw core::IoError(ErrnoText("close failed on", path_));
  }
}

}  // namespace vqexec::io
