// Repository: Retrovue-vqexec
// Component: FFmpeg Transcoder
// Purpose: Build and run the ffmpeg command that decodes, filters and
//          rescales a source into raw frames.
// Copyright (c) 2026 RetroVue

#include "vqexec/pipeline/FfmpegTranscoder.hpp"

#include <cstdlib>

#include "vqexec/core/Errors.hpp"
#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Logger.hpp"
#include "vqexec/util/Process.hpp"

namespace vqexec::pipeline {

namespace {

// Image sequences are numbered from an arbitrary start frame.
constexpr const char* kStartNumberRange = "2147483647";

}  // namespace

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path)
    : configured_path_(std::move(ffmpeg_path)) {}

std::optional<std::string> FfmpegTranscoder::ResolveBinary() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (resolved_) return resolved_;

  std::string wanted = configured_path_;
  if (wanted.empty()) {
    const char* env = std::getenv("VQEXEC_FFMPEG");
    wanted = (env != nullptr && env[0] != '\0') ? env : "ffmpeg";
  }
  resolved_ = util::FindExecutable(wanted);
  return resolved_;
}

void FfmpegTranscoder::EnsureAvailable() {
  if (!ResolveBinary()) {
    throw core::MissingDependencyError(
        "ffmpeg not found (set ffmpeg_path, $VQEXEC_FFMPEG, or add it to PATH)");
  }
}

std::vector<std::string> FfmpegTranscoder::SourceFormatArguments(
    const asset::StreamSpec& source) {
  if (source.IsRaw()) {
    std::vector<std::string> args = {"-f", "rawvideo", "-pix_fmt", source.yuv_type};
    if (source.geometry) {
      args.push_back("-s");
      args.push_back(source.geometry->ToString());
    }
    return args;
  }

  const std::string ext = util::FileExtension(source.path);
  if (ext == "j2c" || ext == "j2k" || ext == "tiff") {
    return {"-f", "image2", "-start_number_range", kStartNumberRange};
  }
  if (ext == "icpf") {
    return {"-f", "image2", "-c:v", "netflixprores", "-start_number_range",
            kStartNumberRange};
  }
  if (ext == "265") {
    return {"-c:v", "hevc"};
  }
  return {};
}

std::string FfmpegTranscoder::BuildFilterChain(const TranscodeRequest& request) {
  const asset::StreamSpec& src = request.source;
  std::string chain;

  if (src.frame_range) {
    const std::string s = std::to_string(src.frame_range->start_frame);
    const std::string e = std::to_string(src.frame_range->end_frame);
    // "\," is the filtergraph escape for a comma inside an expression.
    chain += "select=gte(n\\," + s + ")*gte(" + e + "\\,n),setpts=PTS-STARTPTS,";
  }
  if (const std::string* crop = src.Filter("crop")) chain += "crop=" + *crop + ",";
  if (const std::string* pad = src.Filter("pad")) chain += "pad=" + *pad + ",";

  chain += "scale=" + request.target_geometry.ToString();

  for (const char* key : {"gblur", "eq", "lutyuv"}) {
    if (const std::string* value = src.Filter(key)) {
      chain += std::string(",") + key + "=" + *value;
    }
  }
  return chain;
}

std::vector<std::string> FfmpegTranscoder::BuildArguments(const std::string& binary,
                                                          const TranscodeRequest& request) {
  std::vector<std::string> args = {binary};
  for (auto& a : SourceFormatArguments(request.source)) args.push_back(std::move(a));

  args.insert(args.end(), {"-i", request.source.path, "-an", "-vsync", "0",
                           "-pix_fmt", request.target_yuv_type});
  if (request.source.frame_range) {
    args.push_back("-vframes");
    args.push_back(std::to_string(request.source.frame_range->FrameCount()));
  }
  args.insert(args.end(), {"-vf", BuildFilterChain(request), "-f", "rawvideo",
                           "-sws_flags", request.source.resampling_type, "-y",
                           "-nostdin", request.dest_path});
  return args;
}

void FfmpegTranscoder::Transcode(const TranscodeRequest& request,
                                 const ProcessObserver& on_spawn) {
  EnsureAvailable();
  const auto argv = BuildArguments(*ResolveBinary(), request);
  util::Logger::Debug("[FfmpegTranscoder] RUN " + util::JoinCommandLine(argv));

  const int status = util::RunProcess(argv, on_spawn);
  if (status != 0) {
    throw core::ExternalProcessError(
        "ffmpeg exited with status " + std::to_string(status) + " for " +
            request.source.path + " -> " + request.dest_path,
        status);
  }
}

}  // namespace vqexec::pipeline
