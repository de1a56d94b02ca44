// Repository: Retrovue-vqexec
// Component: Fake Transcoder
// Purpose: In-process transcoder double that copies raw sources frame by
//          frame and counts calls.
// Copyright (c) 2026 RetroVue

#include "fixtures/FakeTranscoder.h"

#include "vqexec/core/Errors.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/RawPlaneReader.hpp"

namespace vqexec::tests::fixtures {

void FakeTranscoder::EnsureAvailable() {
  ensure_calls_.fetch_add(1);
  if (!available_.load()) {
    throw core::MissingDependencyError("fake transcoder marked unavailable");
  }
}

std::vector<pipeline::TranscodeRequest> FakeTranscoder::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

void FakeTranscoder::Transcode(const pipeline::TranscodeRequest& request,
                               const pipeline::ProcessObserver& on_spawn) {
  (void)on_spawn;
  transcode_calls_.fetch_add(1);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
  }
  if (fail_.load()) {
    throw core::ExternalProcessError("fake transcoder failure for " + request.source.path,
                                     1);
  }

  const auto& src = request.source;
  if (!src.IsRaw() || !src.geometry || *src.geometry != request.target_geometry ||
      src.yuv_type != request.target_yuv_type) {
    throw core::ExternalProcessError(
        "fake transcoder cannot convert " + src.path + " to " +
            request.target_geometry.ToString() + " " + request.target_yuv_type,
        1);
  }

  const io::PixelFormat format = io::PixelFormat::Lookup(request.target_yuv_type);
  const int w = request.target_geometry.width;
  const int h = request.target_geometry.height;
  io::RawPlaneReader reader(src.path, format, w, h);
  io::RawPlaneWriter writer(request.dest_path, format, w, h);

  io::PlanarFrame frame;
  int64_t index = 0;
  while (reader.Next(frame)) {
    if (src.frame_range) {
      if (index > src.frame_range->end_frame) break;
      if (index < src.frame_range->start_frame) {
        ++index;
        continue;
      }
    }
    writer.Write(frame);
    ++index;
  }
  writer.Close();
}

}  // namespace vqexec::tests::fixtures
