// Repository: Retrovue-vqexec
// Component: Standalone Executor Harness
// Purpose: Drives the executor end-to-end on one asset for diagnostics.
// Copyright (c) 2026 RetroVue
//
// This binary is for testing and diagnostics only. Plugins: psnr
// (full-reference) and mean_luma (no-reference, two passes).

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/cache/FileSystemResultStore.hpp"
#include "vqexec/core/Errors.hpp"
#include "vqexec/core/ExecutorConfig.hpp"
#include "vqexec/executor/Executor.hpp"
#include "vqexec/plugins/MeanLumaPlugin.hpp"
#include "vqexec/plugins/PsnrPlugin.hpp"

namespace {

using vqexec::asset::Geometry;
using vqexec::asset::StreamSpec;

// =============================================================================
// CLI Arguments
// =============================================================================
struct StreamArgs {
  std::string path;
  std::optional<Geometry> size;
  std::string fmt = vqexec::asset::kDefaultYuvType;
  std::vector<std::pair<std::string, std::string>> filters;
};

struct CliArgs {
  std::string plugin = "psnr";
  StreamArgs ref;
  StreamArgs dis;
  std::optional<Geometry> quality_size;
  std::optional<std::string> workfile_fmt;
  std::optional<int64_t> start_frame;
  std::optional<int64_t> end_frame;
  std::string resampling = vqexec::asset::kDefaultResamplingType;

  std::string dataset = "cli";
  int64_t content_id = 0;
  int64_t asset_id = 0;
  std::string workdir = "/tmp/vqexec";
  std::string store_root;  // Default: {workdir}/results

  bool fifo_mode = true;
  bool keep_workdir = false;
  bool save_workfiles = false;
  bool exclusive_lease = false;
  bool remove = false;
  std::string ffmpeg_path;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Runs one computation over one asset through the full executor\n"
            << "pipeline (cache, transcode, sample transform, compute, cleanup).\n"
            << "\n"
            << "STREAMS:\n"
            << "  --ref PATH             Reference stream (psnr only)\n"
            << "  --dis PATH             Distorted stream\n"
            << "  --ref-size WxH         Native geometry of a raw reference\n"
            << "  --dis-size WxH         Native geometry of a raw distorted stream\n"
            << "  --ref-fmt FMT          yuv420p (default), yuv420p10le, gray, notyuv, ...\n"
            << "  --dis-fmt FMT\n"
            << "  --ref-filter K=V       crop|pad|gblur|eq|lutyuv (repeatable)\n"
            << "  --dis-filter K=V\n"
            << "  --start-frame N        Frame range applied to both streams\n"
            << "  --end-frame N\n"
            << "  --resampling ALG       Scaler algorithm (default: bicubic)\n"
            << "\n"
            << "COMPUTATION:\n"
            << "  --plugin NAME          psnr (default) or mean_luma\n"
            << "  --quality-size WxH     Compute geometry\n"
            << "  --workfile-fmt FMT     Workfile sample format override\n"
            << "\n"
            << "ASSET / STORAGE:\n"
            << "  --dataset NAME --content-id N --asset-id N\n"
            << "  --workdir DIR          Run directories (default: /tmp/vqexec)\n"
            << "  --store DIR            Result store root (default: WORKDIR/results)\n"
            << "  --remove               Delete the cached result instead of running\n"
            << "\n"
            << "EXECUTION:\n"
            << "  --no-fifo              Materialize intermediate stages as files\n"
            << "  --keep-workdir         Keep stage artifacts and the run log\n"
            << "  --save-workfiles       Snapshot workfiles into the store (needs --no-fifo)\n"
            << "  --exclusive-lease      Serialize computation of one asset across processes\n"
            << "  --ffmpeg PATH          Transcoder binary\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name
            << " --ref ref.yuv --ref-size 1920x1080 --dis dis.mp4 --dis-fmt notyuv \\\n"
            << "      --quality-size 1920x1080\n"
            << "\n";
}

std::optional<Geometry> ParseGeometry(const std::string& text) {
  const auto x = text.find('x');
  if (x == std::string::npos) return std::nullopt;
  try {
    Geometry g{std::stoi(text.substr(0, x)), std::stoi(text.substr(x + 1))};
    if (g.width <= 0 || g.height <= 0) return std::nullopt;
    return g;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

bool ParseFilter(const std::string& text, std::vector<std::pair<std::string, std::string>>& out) {
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) return false;
  out.emplace_back(text.substr(0, eq), text.substr(eq + 1));
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--ref" && has_value) {
      args.ref.path = argv[++i];
    } else if (arg == "--dis" && has_value) {
      args.dis.path = argv[++i];
    } else if ((arg == "--ref-size" || arg == "--dis-size" || arg == "--quality-size") &&
               has_value) {
      auto g = ParseGeometry(argv[++i]);
      if (!g) {
        args.error = "Bad geometry for " + arg + ": " + argv[i];
        return args;
      }
      if (arg == "--ref-size") args.ref.size = g;
      else if (arg == "--dis-size") args.dis.size = g;
      else args.quality_size = g;
    } else if (arg == "--ref-fmt" && has_value) {
      args.ref.fmt = argv[++i];
    } else if (arg == "--dis-fmt" && has_value) {
      args.dis.fmt = argv[++i];
    } else if ((arg == "--ref-filter" || arg == "--dis-filter") && has_value) {
      auto& filters = (arg == "--ref-filter") ? args.ref.filters : args.dis.filters;
      if (!ParseFilter(argv[++i], filters)) {
        args.error = "Filter must be KEY=VALUE: " + std::string(argv[i]);
        return args;
      }
    } else if (arg == "--start-frame" && has_value) {
      args.start_frame = std::stoll(argv[++i]);
    } else if (arg == "--end-frame" && has_value) {
      args.end_frame = std::stoll(argv[++i]);
    } else if (arg == "--resampling" && has_value) {
      args.resampling = argv[++i];
    } else if (arg == "--plugin" && has_value) {
      args.plugin = argv[++i];
    } else if (arg == "--workfile-fmt" && has_value) {
      args.workfile_fmt = argv[++i];
    } else if (arg == "--dataset" && has_value) {
      args.dataset = argv[++i];
    } else if (arg == "--content-id" && has_value) {
      args.content_id = std::stoll(argv[++i]);
    } else if (arg == "--asset-id" && has_value) {
      args.asset_id = std::stoll(argv[++i]);
    } else if (arg == "--workdir" && has_value) {
      args.workdir = argv[++i];
    } else if (arg == "--store" && has_value) {
      args.store_root = argv[++i];
    } else if (arg == "--ffmpeg" && has_value) {
      args.ffmpeg_path = argv[++i];
    } else if (arg == "--no-fifo") {
      args.fifo_mode = false;
    } else if (arg == "--keep-workdir") {
      args.keep_workdir = true;
    } else if (arg == "--save-workfiles") {
      args.save_workfiles = true;
    } else if (arg == "--exclusive-lease") {
      args.exclusive_lease = true;
    } else if (arg == "--remove") {
      args.remove = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.plugin != "psnr" && args.plugin != "mean_luma") {
    args.error = "Unknown plugin: " + args.plugin;
    return args;
  }
  if (args.dis.path.empty()) {
    args.error = "Must specify --dis";
    return args;
  }
  if (args.plugin == "psnr" && args.ref.path.empty()) {
    args.error = "psnr requires --ref";
    return args;
  }
  if (args.start_frame.has_value() != args.end_frame.has_value()) {
    args.error = "--start-frame and --end-frame go together";
    return args;
  }

  if (args.store_root.empty()) {
    args.store_root = args.workdir + "/results";
  }
  args.valid = true;
  return args;
}

StreamSpec BuildStream(const StreamArgs& in, const CliArgs& args) {
  StreamSpec s;
  s.path = in.path;
  s.geometry = in.size;
  s.yuv_type = in.fmt;
  s.resampling_type = args.resampling;
  for (const auto& [key, value] : in.filters) {
    s.filters[key] = value;
  }
  if (args.start_frame) {
    s.frame_range = vqexec::asset::FrameRange{*args.start_frame, *args.end_frame};
  }
  return s;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args;
  try {
    args = ParseArgs(argc, argv);
  } catch (const std::logic_error& e) {
    std::cerr << "Error: bad numeric argument (" << e.what() << ")\n\n";
    PrintUsage(argv[0]);
    return 2;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  try {
    vqexec::asset::AssetSpec spec;
    spec.dataset = args.dataset;
    spec.content_id = args.content_id;
    spec.asset_id = args.asset_id;
    spec.workdir = args.workdir;
    if (!args.ref.path.empty()) {
      spec.reference = BuildStream(args.ref, args);
    }
    spec.distorted = BuildStream(args.dis, args);
    spec.quality_geometry = args.quality_size;
    spec.workfile_yuv_type = args.workfile_fmt;
    const vqexec::asset::Asset asset(std::move(spec));

    vqexec::core::ExecutorConfig config;
    config.fifo_mode = args.fifo_mode;
    config.delete_workdir = !args.keep_workdir;
    config.save_workfiles = args.save_workfiles;
    config.ffmpeg_path = args.ffmpeg_path;
    if (args.exclusive_lease) {
      config.race_policy = vqexec::core::CacheRacePolicy::kExclusiveLease;
    }

    std::unique_ptr<vqexec::executor::IComputePlugin> plugin;
    vqexec::pipeline::Topology topology = vqexec::pipeline::Topology::FullReference();
    if (args.plugin == "psnr") {
      plugin = std::make_unique<vqexec::plugins::PsnrPlugin>();
    } else {
      plugin = std::make_unique<vqexec::plugins::MeanLumaPlugin>();
      topology = vqexec::pipeline::Topology::NoReference();
    }

    vqexec::cache::FileSystemResultStore store(args.store_root);
    vqexec::executor::Executor executor(config, *plugin, store, topology);

    if (args.remove) {
      executor.RemoveResults({asset});
      std::cout << "removed " << executor.identity().Id() << " " << asset.ToString()
                << "\n";
      return 0;
    }

    const auto results = executor.Run({asset});
    for (const auto& result : results) {
      std::cout << result.Summary();
    }
    return 0;
  } catch (const vqexec::core::ExecutorError& e) {
    std::cerr << "[HARNESS] " << vqexec::core::ErrorKindToString(e.kind()) << ": "
              << e.what() << "\n";
    return 1;
  }
}
