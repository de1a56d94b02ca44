// Repository: Retrovue-vqexec
// Component: FFmpeg Transcoder
// Purpose: ITranscoder that runs the ffmpeg command-line tool.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_FFMPEG_TRANSCODER_HPP_
#define VQEXEC_PIPELINE_FFMPEG_TRANSCODER_HPP_

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vqexec/pipeline/ITranscoder.hpp"

namespace vqexec::pipeline {

// Command line (no shell involved):
//
//   ffmpeg [SRC_FMT] -i SRC -an -vsync 0 -pix_fmt WF_FMT [-vframes N]
//          -vf [SELECT,][CROP,][PAD,]scale=WxH[,GBLUR][,EQ][,LUTYUV]
//          -f rawvideo -sws_flags RESAMPLE -y -nostdin DST
class FfmpegTranscoder : public ITranscoder {
 public:
  // Empty path: $VQEXEC_FFMPEG, then "ffmpeg" on PATH.
  explicit FfmpegTranscoder(std::string ffmpeg_path = "");

  void EnsureAvailable() override;
  void Transcode(const TranscodeRequest& request,
                 const ProcessObserver& on_spawn = nullptr) override;

  // Full argument vector, argv[0] = `binary`.
  static std::vector<std::string> BuildArguments(const std::string& binary,
                                                 const TranscodeRequest& request);

  // Input-side arguments derived from the source's format or extension.
  static std::vector<std::string> SourceFormatArguments(const asset::StreamSpec& source);

  // The -vf filter chain.
  static std::string BuildFilterChain(const TranscodeRequest& request);

 private:
  // Resolved binary, or nullopt. Cached after the first successful lookup.
  std::optional<std::string> ResolveBinary();

  std::string configured_path_;
  std::mutex mutex_;
  std::optional<std::string> resolved_;
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_FFMPEG_TRANSCODER_HPP_
