// Repository: Retrovue-vqexec
// Component: Raw Stream Test Files
// Purpose: Scratch directories and synthetic raw video streams for tests.
// Copyright (c) 2026 RetroVue

#include "fixtures/RawStreamFiles.h"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/PlanarFrame.hpp"
#include "vqexec/io/RawPlaneReader.hpp"

namespace vqexec::tests::fixtures {

namespace fs = std::filesystem;

TempDir::TempDir(const std::string& tag) {
  const char* base = std::getenv("TMPDIR");
  std::string pattern = std::string(base != nullptr && base[0] != '\0' ? base : "/tmp") +
                        "/vqexec_" + tag + "_XXXXXX";
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed for " + pattern);
  }
  path_ = buf.data();
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

int64_t WriteRawStream(const std::string& path, const std::string& yuv_type, int width,
                       int height, int frames, int base) {
  const io::PixelFormat format = io::PixelFormat::Lookup(yuv_type);
  const double max = static_cast<double>(format.max_value());
  const int modulus = format.max_value() + 1;

  io::RawPlaneWriter writer(path, format, width, height);
  io::PlanarFrame frame;
  frame.y.Resize(width, height);
  if (format.plane_count() == 3) {
    const int cw = format.PlaneWidth(1, width);
    const int ch = format.PlaneHeight(1, height);
    frame.u.Resize(cw, ch);
    frame.v.Resize(cw, ch);
    const float mid = static_cast<float>((modulus / 2) / max);
    std::fill(frame.u.samples.begin(), frame.u.samples.end(), mid);
    std::fill(frame.v.samples.begin(), frame.v.samples.end(), mid);
  }

  for (int f = 0; f < frames; ++f) {
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        frame.y.at(x, y) = static_cast<float>(((base + f + x + y) % modulus) / max);
      }
    }
    writer.Write(frame);
  }
  writer.Close();
  return static_cast<int64_t>(format.FrameBytes(width, height)) * frames;
}

int64_t FileSize(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return -1;
  return static_cast<int64_t>(st.st_size);
}

int CountEntries(const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return -1;
  int n = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
       it.increment(ec)) {
    ++n;
  }
  return n;
}

}  // namespace vqexec::tests::fixtures
