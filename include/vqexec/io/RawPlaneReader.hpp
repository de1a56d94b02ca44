// Repository: Retrovue-vqexec
// Component: Raw Plane Reader / Writer
// Purpose: Frame-at-a-time planar I/O on raw sample files and named pipes,
//          with integer <-> normalized float conversion.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_IO_RAW_PLANE_READER_HPP_
#define VQEXEC_IO_RAW_PLANE_READER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/PlanarFrame.hpp"

namespace vqexec::io {

// Reads consecutive frames. Opening a named pipe blocks until a writer
// appears, as open(2) does.
class RawPlaneReader {
 public:
  // Throws core::IoError if the path cannot be opened.
  RawPlaneReader(const std::string& path, PixelFormat format, int width, int height);
  ~RawPlaneReader();

  RawPlaneReader(const RawPlaneReader&) = delete;
  RawPlaneReader& operator=(const RawPlaneReader&) = delete;

  // Fills `frame` with the next frame. Returns false at a clean end of
  // stream. Throws core::IoError on a read fault or a truncated frame.
  bool Next(PlanarFrame& frame);

  int64_t frames_read() const { return frames_read_; }
  const PixelFormat& format() const { return format_; }

 private:
  std::string path_;
  PixelFormat format_;
  int width_;
  int height_;
  int fd_ = -1;
  int64_t frames_read_ = 0;
  std::vector<uint8_t> buffer_;
};

// Writes consecutive frames, rounding and clamping normalized samples back to
// the format's integer range. Creates or truncates a regular file; opening a
// named pipe blocks until a reader appears.
class RawPlaneWriter {
 public:
  // Throws core::IoError if the path cannot be opened.
  RawPlaneWriter(const std::string& path, PixelFormat format, int width, int height);
  ~RawPlaneWriter();

  RawPlaneWriter(const RawPlaneWriter&) = delete;
  RawPlaneWriter& operator=(const RawPlaneWriter&) = delete;

  // Throws core::IoError on a write fault, including a pipe whose reader has
  // gone away (no SIGPIPE is delivered to the process).
  void Write(const PlanarFrame& frame);

  // Closes the descriptor. Throws core::IoError if close reports an error.
  void Close();

  int64_t frames_written() const { return frames_written_; }

 private:
  std::string path_;
  PixelFormat format_;
  int width_;
  int height_;
  int fd_ = -1;
  int64_t frames_written_ = 0;
  std::vector<uint8_t> buffer_;
};

}  // namespace vqexec::io

#endif  // VQEXEC_IO_RAW_PLANE_READER_HPP_
