// Repository: Retrovue-vqexec
// Component: FFmpeg Transcoder Tests
// Purpose: Command-line construction (input format, frame range, filter
//          order) and binary resolution. No ffmpeg binary is required.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "fixtures/RawStreamFiles.h"
#include "vqexec/core/Errors.hpp"
#include "vqexec/pipeline/FfmpegTranscoder.hpp"

namespace vqexec::pipeline {
namespace {

using asset::Geometry;
using asset::StreamSpec;

TranscodeRequest RawRequest() {
  TranscodeRequest r;
  r.source.path = "/data/src.yuv";
  r.source.geometry = Geometry{1920, 1080};
  r.source.yuv_type = "yuv420p";
  r.target_geometry = Geometry{1280, 720};
  r.target_yuv_type = "yuv420p";
  r.dest_path = "/work/dis_workfile.yuv";
  return r;
}

// Value following `flag`, or "" when absent.
std::string ValueOf(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) return "";
  return *(it + 1);
}

TEST(FfmpegTranscoderTest, RawInputDeclaresFormatAndSize) {
  const auto args = FfmpegTranscoder::BuildArguments("/usr/bin/ffmpeg", RawRequest());
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.front(), "/usr/bin/ffmpeg");
  EXPECT_EQ(args.back(), "/work/dis_workfile.yuv");

  // Input options precede -i.
  const auto input = std::find(args.begin(), args.end(), "-i");
  ASSERT_NE(input, args.end());
  const std::vector<std::string> before(args.begin() + 1, input);
  EXPECT_EQ(before, (std::vector<std::string>{"-f", "rawvideo", "-pix_fmt", "yuv420p",
                                              "-s", "1920x1080"}));
  EXPECT_EQ(*(input + 1), "/data/src.yuv");

  EXPECT_EQ(ValueOf(args, "-vf"), "scale=1280x720");
  EXPECT_EQ(ValueOf(args, "-sws_flags"), "bicubic");
  EXPECT_EQ(ValueOf(args, "-vsync"), "0");
  EXPECT_NE(std::find(args.begin(), args.end(), "-an"), args.end());
  EXPECT_NE(std::find(args.begin(), args.end(), "-nostdin"), args.end());
  EXPECT_EQ(std::find(args.begin(), args.end(), "-vframes"), args.end());
}

TEST(FfmpegTranscoderTest, FrameRangeSelectsAndCountsFrames) {
  TranscodeRequest r = RawRequest();
  r.source.frame_range = asset::FrameRange{10, 19};
  const auto args = FfmpegTranscoder::BuildArguments("ffmpeg", r);
  EXPECT_EQ(ValueOf(args, "-vframes"), "10");
  EXPECT_EQ(ValueOf(args, "-vf"),
            "select=gte(n\\,10)*gte(19\\,n),setpts=PTS-STARTPTS,scale=1280x720");
}

TEST(FfmpegTranscoderTest, FiltersApplyInFixedOrder) {
  TranscodeRequest r = RawRequest();
  // Inserted out of order on purpose.
  r.source.filters["lutyuv"] = "y=negval";
  r.source.filters["eq"] = "contrast=1.2";
  r.source.filters["gblur"] = "sigma=1";
  r.source.filters["pad"] = "1920:1080:0:0";
  r.source.filters["crop"] = "1800:1000:60:40";
  EXPECT_EQ(FfmpegTranscoder::BuildFilterChain(r),
            "crop=1800:1000:60:40,pad=1920:1080:0:0,scale=1280x720,"
            "gblur=sigma=1,eq=contrast=1.2,lutyuv=y=negval");
}

TEST(FfmpegTranscoderTest, ResamplingTypeBecomesScalerFlags) {
  TranscodeRequest r = RawRequest();
  r.source.resampling_type = "lanczos";
  EXPECT_EQ(ValueOf(FfmpegTranscoder::BuildArguments("ffmpeg", r), "-sws_flags"), "lanczos");
}

TEST(FfmpegTranscoderTest, EncodedInputsByExtension) {
  StreamSpec s;
  s.yuv_type = asset::kNotYuv;

  s.path = "/data/clip.mp4";
  EXPECT_TRUE(FfmpegTranscoder::SourceFormatArguments(s).empty());

  s.path = "/data/seq/frame_%08d.J2K";
  EXPECT_EQ(FfmpegTranscoder::SourceFormatArguments(s),
            (std::vector<std::string>{"-f", "image2", "-start_number_range", "2147483647"}));

  s.path = "/data/seq/frame_%08d.tiff";
  EXPECT_EQ(ValueOf(FfmpegTranscoder::SourceFormatArguments(s), "-f"), "image2");

  s.path = "/data/seq/frame_%08d.icpf";
  EXPECT_EQ(ValueOf(FfmpegTranscoder::SourceFormatArguments(s), "-c:v"), "netflixprores");

  s.path = "/data/stream.265";
  EXPECT_EQ(FfmpegTranscoder::SourceFormatArguments(s),
            (std::vector<std::string>{"-c:v", "hevc"}));
}

TEST(FfmpegTranscoderTest, MissingBinaryIsAMissingDependency) {
  tests::fixtures::TempDir dir("ffmpeg");
  FfmpegTranscoder transcoder(dir.Join("no-such-ffmpeg"));
  EXPECT_THROW(transcoder.EnsureAvailable(), core::MissingDependencyError);
  EXPECT_THROW(transcoder.Transcode(RawRequest()), core::MissingDependencyError);
}

TEST(FfmpegTranscoderTest, NonzeroExitIsAnExternalProcessError) {
  // /bin/false stands in for a tool that rejects its arguments.
  FfmpegTranscoder transcoder("/bin/false");
  EXPECT_NO_THROW(transcoder.EnsureAvailable());
  try {
    transcoder.Transcode(RawRequest());
    FAIL() << "expected ExternalProcessError";
  } catch (const core::ExternalProcessError& e) {
    EXPECT_EQ(e.exit_status(), 1);
    EXPECT_EQ(e.kind(), core::ErrorKind::kExternalProcess);
  }
}

}  // namespace
}  // namespace vqexec::pipeline
