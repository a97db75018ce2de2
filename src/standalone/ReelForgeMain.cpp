// Repository: ReelForge
// Component: ReelForge Command-Line Tool
// Purpose: Builds edit templates from a video (scene detection) or from an
//          item list (count-based allocation) without the gRPC service.
// Copyright (c) 2025 ReelForge
//
// MODES OF OPERATION:
// 1. Video mode:      --video PATH [--title TEXT] [--label TEXT ...]
// 2. Allocation mode: --duration MS [--items N] [--label TEXT ...]
// 3. Store queries:   --store DIR (--list | --get ID | --delete ID)

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "reelforge/decode/FFmpegFrameDecoder.h"
#include "reelforge/pipeline/TemplatePipeline.hpp"
#include "reelforge/store/FileTemplateStore.hpp"
#include "reelforge/store/TemplateProto.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/timeline/TimeMath.hpp"
#include "reelforge/timeline/TimelineAllocator.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_cancel_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_cancel_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  // Video mode
  std::string video_path;
  double threshold = 0.0;        // 0 = default
  int64_t min_scene_ms = -1;     // -1 = default
  int64_t interval_ms = 0;       // 0 = default
  int64_t budget_ms = 0;         // 0 = unlimited

  // Shared
  std::string title;
  std::vector<std::string> labels;
  std::vector<std::string> media;
  int64_t duration_ms = 0;
  std::optional<size_t> item_count;
  std::optional<std::string> hook_text;
  std::optional<std::string> outro_text;

  // Store
  std::string store_dir;
  bool list = false;
  std::string get_id;
  std::string delete_id;

  // Output options
  bool json = false;
  bool pretty = false;
  bool thumbnails = false;
  bool progress = false;
  bool help = false;
  bool valid = false;
  std::string error;

  bool IsVideoMode() const { return !video_path.empty(); }
  bool IsStoreQuery() const { return list || !get_id.empty() || !delete_id.empty(); }
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Builds a fill-in-the-blanks edit template.\n"
            << "\n"
            << "VIDEO MODE (scene detection, falls back to allocation):\n"
            << "  --video PATH         Video file or URL\n"
            << "  --threshold X        Boundary threshold in (0,1) (default: 0.3)\n"
            << "  --min-scene MS       Minimum scene length (default: 1000)\n"
            << "  --interval MS        Sampling interval (default: 1000)\n"
            << "  --budget-ms MS       Whole-run wall-clock budget (default: unlimited)\n"
            << "\n"
            << "ALLOCATION MODE:\n"
            << "  --duration MS        Total duration (required without --video)\n"
            << "  --items N            Item count (default: labels, then title, then 5)\n"
            << "  --hook TEXT          Intro overlay text\n"
            << "  --outro TEXT         Outro overlay text\n"
            << "\n"
            << "COMMON:\n"
            << "  --title TEXT         Title; item count, labels and emoji are parsed from it\n"
            << "  --label TEXT         Item label (repeatable)\n"
            << "  --media URI          Footage for the next location group (repeatable)\n"
            << "\n"
            << "STORE:\n"
            << "  --store DIR          Save templates under DIR\n"
            << "  --list               List stored templates, newest first\n"
            << "  --get ID             Print a stored template\n"
            << "  --delete ID          Delete a stored template\n"
            << "\n"
            << "OUTPUT OPTIONS:\n"
            << "  --json               Print the template as JSON\n"
            << "  --pretty             Indent JSON output\n"
            << "  --thumbnails         Include base64 thumbnails in JSON output\n"
            << "  --progress           Report detection progress on stderr\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --video reel.mp4 --title \"Top 5 cafes in Lisbon\" --json\n"
            << "  " << program_name << " --duration 20000 --label \"Cafe A\" --label \"Park B\"\n"
            << "  " << program_name << " --store /tmp/templates --list\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--video" && i + 1 < argc) {
        args.video_path = argv[++i];
      } else if (arg == "--threshold" && i + 1 < argc) {
        args.threshold = std::stod(argv[++i]);
      } else if (arg == "--min-scene" && i + 1 < argc) {
        args.min_scene_ms = std::stoll(argv[++i]);
      } else if (arg == "--interval" && i + 1 < argc) {
        args.interval_ms = std::stoll(argv[++i]);
      } else if (arg == "--budget-ms" && i + 1 < argc) {
        args.budget_ms = std::stoll(argv[++i]);
      } else if (arg == "--duration" && i + 1 < argc) {
        args.duration_ms = std::stoll(argv[++i]);
      } else if (arg == "--items" && i + 1 < argc) {
        const long long n = std::stoll(argv[++i]);
        if (n < 0) {
          args.error = "--items must be >= 0";
          return args;
        }
        if (static_cast<unsigned long long>(n) > reelforge::timeline::AllocatorConfig().max_items) {
          args.error = "--items must be <= " +
                       std::to_string(reelforge::timeline::AllocatorConfig().max_items);
          return args;
        }
        args.item_count = static_cast<size_t>(n);
      } else if (arg == "--title" && i + 1 < argc) {
        args.title = argv[++i];
      } else if (arg == "--label" && i + 1 < argc) {
        args.labels.push_back(argv[++i]);
      } else if (arg == "--media" && i + 1 < argc) {
        args.media.push_back(argv[++i]);
      } else if (arg == "--hook" && i + 1 < argc) {
        args.hook_text = argv[++i];
      } else if (arg == "--outro" && i + 1 < argc) {
        args.outro_text = argv[++i];
      } else if (arg == "--store" && i + 1 < argc) {
        args.store_dir = argv[++i];
      } else if (arg == "--list") {
        args.list = true;
      } else if (arg == "--get" && i + 1 < argc) {
        args.get_id = argv[++i];
      } else if (arg == "--delete" && i + 1 < argc) {
        args.delete_id = argv[++i];
      } else if (arg == "--json") {
        args.json = true;
      } else if (arg == "--pretty") {
        args.pretty = true;
      } else if (arg == "--thumbnails") {
        args.thumbnails = true;
      } else if (arg == "--progress") {
        args.progress = true;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Malformed numeric value: ") + e.what();
    return args;
  }

  // Validate arguments
  if (args.IsStoreQuery()) {
    if (args.store_dir.empty()) {
      args.error = "--list, --get and --delete require --store";
      return args;
    }
    args.valid = true;
    return args;
  }

  if (!args.IsVideoMode() && args.duration_ms <= 0) {
    args.error = "Must specify either --video or a positive --duration";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Output
// =============================================================================

class StderrProgress : public reelforge::detect::IDetectionObserver {
 public:
  void OnProgress(double fraction) override {
    const int percent = static_cast<int>(fraction * 100.0);
    if (percent / 10 > last_decile_) {
      last_decile_ = percent / 10;
      std::cerr << "[reelforge] progress " << percent << "%\n";
    }
  }

  void OnSceneFinalized(const reelforge::timeline::Scene& scene) override {
    std::cerr << "[reelforge] scene " << scene.id << " [" << scene.start_ms << ", "
              << scene.end_ms << ") ms\n";
  }

 private:
  int last_decile_ = -1;
};

void PrintTemplate(const reelforge::pipeline::Template& tmpl) {
  namespace time_math = reelforge::timeline::time_math;

  std::cout << "\n";
  std::cout << "Template:   " << tmpl.id << "\n";
  if (tmpl.video_info && !tmpl.video_info->title.empty()) {
    std::cout << "Title:      " << tmpl.video_info->title << "\n";
  }
  std::cout << "Method:     " << tmpl.extraction_method;
  if (tmpl.used_fallback) {
    std::cout << " (fallback: "
              << reelforge::timeline::ExtractionErrorToString(tmpl.detection_error) << ")";
  }
  std::cout << "\n";
  std::cout << "Duration:   " << std::fixed << std::setprecision(1)
            << time_math::MsToSecondsOneDecimal(tmpl.total_duration_ms) << " s\n";
  if (tmpl.drift_ms != 0) {
    std::cout << "Drift:      " << tmpl.drift_ms << " ms\n";
  }
  std::cout << "\n";

  for (const auto& group : tmpl.location_groups) {
    std::cout << "  [" << std::setw(2) << std::right << group.location_id << "] "
              << std::setw(28) << std::left << group.location_name << " "
              << std::setw(6) << std::right
              << time_math::MsToSecondsOneDecimal(group.total_duration_ms()) << " s\n";
    for (const auto& scene : group.scenes) {
      std::cout << "         " << std::setw(7) << std::right << scene.start_ms << " - "
                << std::setw(7) << scene.end_ms << " ms  "
                << reelforge::timeline::StyleClassName(scene.style_class);
      if (scene.text_overlay) std::cout << "  \"" << *scene.text_overlay << "\"";
      if (scene.media_uri) std::cout << "  <" << *scene.media_uri << ">";
      std::cout << "\n";
    }
  }
  std::cout << "\n";
}

int EmitTemplate(const reelforge::pipeline::Template& tmpl, const CliArgs& args) {
  if (!args.json) {
    PrintTemplate(tmpl);
    return 0;
  }
  std::string json;
  if (!reelforge::store::ToJson(tmpl, args.pretty, args.thumbnails, &json)) {
    std::cerr << "Error: template could not be rendered as JSON\n";
    return 1;
  }
  std::cout << json << "\n";
  return 0;
}

// =============================================================================
// Modes
// =============================================================================

int RunStoreQuery(const CliArgs& args, reelforge::store::ITemplateStore& store) {
  if (args.list) {
    for (const auto& summary : store.List()) {
      std::cout << summary.id << "\t" << summary.updated_at_ms << "\t" << summary.title << "\n";
    }
    return 0;
  }
  if (!args.get_id.empty()) {
    auto tmpl = store.Get(args.get_id);
    if (!tmpl) {
      std::cerr << "Error: template " << args.get_id << " not found\n";
      return 1;
    }
    return EmitTemplate(*tmpl, args);
  }
  if (!store.Delete(args.delete_id)) {
    std::cerr << "Error: template " << args.delete_id << " not found\n";
    return 1;
  }
  std::cout << "Deleted " << args.delete_id << "\n";
  return 0;
}

int RunPipeline(const CliArgs& args, reelforge::store::ITemplateStore* store) {
  using namespace reelforge;

  time::SystemTimeSource clock;

  pipeline::PipelineConfig config;
  if (args.threshold != 0.0) config.extraction.detector.threshold = args.threshold;
  if (args.min_scene_ms >= 0) config.extraction.detector.min_scene_ms = args.min_scene_ms;
  if (args.interval_ms > 0) {
    config.extraction.sampler.mode = sampling::SamplingMode::kFixedCadence;
    config.extraction.sampler.interval_ms = args.interval_ms;
  }
  config.extraction.run_budget_ms = args.budget_ms;

  auto factory = [&clock](const std::string& uri) -> std::unique_ptr<sampling::IFrameDecoder> {
    decode::DecoderConfig decoder_config;
    decoder_config.input_uri = uri;
    return std::make_unique<decode::FFmpegFrameDecoder>(decoder_config, clock);
  };

  pipeline::TemplatePipeline pipeline(factory, clock, config, store);

  pipeline::PipelineResult result = pipeline::PipelineResult::Failure(
      timeline::ExtractionError::kComputationError, "no mode selected");
  if (args.IsVideoMode()) {
    pipeline::VideoRequest request;
    request.video_uri = args.video_path;
    request.title = args.title;
    request.item_labels = args.labels;
    request.duration_ms = args.duration_ms;
    request.media_uris = args.media;
    request.cancel = &g_cancel_requested;

    StderrProgress progress;
    result = pipeline.BuildFromVideo(request, args.progress ? &progress : nullptr);
  } else {
    pipeline::ItemsRequest request;
    request.total_duration_ms = args.duration_ms;
    request.item_count = args.item_count;
    request.item_labels = args.labels;
    request.title = args.title;
    request.hook_text = args.hook_text;
    request.outro_text = args.outro_text;
    request.media_uris = args.media;
    result = pipeline.BuildFromItems(request);
  }

  if (!result.ok) {
    std::cerr << "Error: " << timeline::ExtractionErrorToString(result.error);
    if (!result.detail.empty()) std::cerr << ": " << result.detail;
    std::cerr << "\n";
    return 1;
  }
  if (store != nullptr && !result.persisted) {
    std::cerr << "Error: template could not be saved under " << args.store_dir << "\n";
    return 1;
  }
  return EmitTemplate(result.tmpl, args);
}

}  // namespace

int main(int argc, char* argv[]) {
  // Parse CLI arguments
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  // Install signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::unique_ptr<reelforge::store::FileTemplateStore> store;
  if (!args.store_dir.empty()) {
    try {
      store = std::make_unique<reelforge::store::FileTemplateStore>(args.store_dir);
    } catch (const std::runtime_error& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  if (args.IsStoreQuery()) {
    return RunStoreQuery(args, *store);
  }
  return RunPipeline(args, store.get());
}
