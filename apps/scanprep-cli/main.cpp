/**
 * scanprep-cli: quality-gated preprocessing of a directory of document scans.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/scanprep_cli [options] <source_dir> <dest_dir>
 * Every input image is scored, enhanced, binarized (Sauvola for BAD, model for GOOD),
 * deskewed and written to dest_dir as <stem>.png, mirroring the source tree.
 */

#include <scanprep/app/backends.hpp>
#include <scanprep/app/config.hpp>
#include <scanprep/app/document_processor.hpp>
#include <scanprep/app/input_files.hpp>
#include <scanprep/app/pipeline_runner.hpp>
#include <scanprep/app/run_summary.hpp>
#include <scanprep/app/score_cache.hpp>
#ifdef SCANPREP_HAS_TBB
#include <scanprep/app/pipeline_runner_tbb.hpp>
#endif
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitIncomplete = 2;

std::atomic<bool> g_cancel{false};

void on_sigint(int) {
  g_cancel.store(true);
}

void print_usage() {
  std::cout << "Usage: scanprep_cli [options] <source_dir> <dest_dir>\n"
            << "  -k, --k_val <float>              Sauvola k (default 0.24)\n"
            << "  -w, --window_size <odd int>      Sauvola window (default 11)\n"
            << "  -ce, --contrast_enhance          Min-max stretch + CLAHE after denoising\n"
            << "  -r, --regex <pattern>            Only process files whose name matches; copy the rest\n"
            << "  -gb, --goodbad_threshold <float> Quality gate threshold (default 0.335)\n"
            << "  --lower_better                   Lower quality scores are better\n"
            << "  --unscored <skip|bad>            Files without a score: skip (default) or treat as BAD\n"
            << "  --config <path>                  key=value config file, applied before the flags\n"
            << "  --iqa_backend <mock|onnx>        Quality model backend (default mock)\n"
            << "  --iqa_model <path>               ONNX quality model\n"
            << "  --binarizer_backend <mock|onnx>  Binarization model backend (default mock)\n"
            << "  --binarizer_model <path>         ONNX binarization model\n"
            << "  --timeout_ms <ms>                Per-call model timeout, 0 = none\n"
            << "  --workers <n>                    Worker threads, 0 = hardware concurrency\n"
#ifdef SCANPREP_HAS_TBB
            << "  --tbb                            Use the TBB runner instead of the thread pool\n"
#endif
            << "  --log-level <level>              trace|debug|info|warn|error|off (default info)\n"
            << "\nExit code: 0 all files written, 2 some files skipped/failed or run interrupted,"
            << " 1 configuration error.\n";
}

struct CliArgs {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> settings;  // applied after the config file
  std::vector<std::string> positional;
  std::string log_level{"info"};
  bool use_tbb{false};
  bool help{false};
};

CliArgs parse_args(int argc, char* argv[]) {
  CliArgs args;
  auto value_of = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw scanprep::app::ConfigError("missing value for " + flag);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else if (arg == "--config") {
      args.config_path = value_of(i, arg);
    } else if (arg == "-k" || arg == "--k_val") {
      args.settings.emplace_back("sauvola_k", value_of(i, arg));
    } else if (arg == "-w" || arg == "--window_size") {
      args.settings.emplace_back("sauvola_window", value_of(i, arg));
    } else if (arg == "-ce" || arg == "--contrast_enhance") {
      args.settings.emplace_back("contrast_enhance", "true");
    } else if (arg == "-r" || arg == "-re" || arg == "--regex") {
      args.settings.emplace_back("selection_pattern", value_of(i, arg));
    } else if (arg == "-gb" || arg == "--goodbad_threshold") {
      args.settings.emplace_back("goodbad_threshold", value_of(i, arg));
    } else if (arg == "--lower_better") {
      args.settings.emplace_back("score_polarity", "lower_better");
    } else if (arg == "--unscored") {
      args.settings.emplace_back("unscored_policy", value_of(i, arg));
    } else if (arg == "--iqa_backend") {
      args.settings.emplace_back("iqa_backend", value_of(i, arg));
    } else if (arg == "--iqa_model") {
      args.settings.emplace_back("iqa_model_path", value_of(i, arg));
    } else if (arg == "--binarizer_backend") {
      args.settings.emplace_back("binarizer_backend", value_of(i, arg));
    } else if (arg == "--binarizer_model") {
      args.settings.emplace_back("binarizer_model_path", value_of(i, arg));
    } else if (arg == "--timeout_ms") {
      args.settings.emplace_back("model_timeout_ms", value_of(i, arg));
    } else if (arg == "--workers") {
      args.settings.emplace_back("num_workers", value_of(i, arg));
    } else if (arg == "--log-level") {
      args.log_level = value_of(i, arg);
    } else if (arg == "--tbb") {
#ifdef SCANPREP_HAS_TBB
      args.use_tbb = true;
#else
      throw scanprep::app::ConfigError("TBB runner not available (build with -DSCANPREP_USE_TBB=ON)");
#endif
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw scanprep::app::ConfigError("unknown option " + arg);
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace fs = std::filesystem;
  using namespace scanprep::app;

  CliArgs args;
  PreprocessConfig cfg;
  try {
    args = parse_args(argc, argv);
    if (args.help) {
      print_usage();
      return kExitClean;
    }
    const auto level = spdlog::level::from_str(args.log_level);
    if (level == spdlog::level::off && args.log_level != "off") {
      throw ConfigError("invalid --log-level " + args.log_level);
    }
    spdlog::set_level(level);

    if (args.positional.size() != 2) {
      print_usage();
      throw ConfigError("expected <source_dir> <dest_dir>");
    }
    cfg = args.config_path.empty() ? default_config() : load_config(args.config_path);
    for (const auto& [key, value] : args.settings) {
      apply_setting(cfg, key, value);
    }
    validate_config(cfg);
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return kExitFatal;
  }

  const fs::path source_dir = args.positional[0];
  const fs::path dest_dir = args.positional[1];

  try {
    const fs::path cache_path = source_dir / cfg.cache_file_name;
    std::vector<fs::path> files =
        collect_input_files(source_dir, cfg.image_extensions, cache_path, dest_dir);
    spdlog::info("{} input files under {}", files.size(), source_dir.string());

    ScoreCache cache(cache_path);
    spdlog::info("score cache {}: {} entries", cache_path.string(), cache.size());

    DocumentProcessor processor(cfg, source_dir, dest_dir, make_quality_assessor(cfg),
                                make_binarizer_backend(cfg), &cache);

    std::signal(SIGINT, on_sigint);

    RunSummary summary;
#ifdef SCANPREP_HAS_TBB
    if (args.use_tbb) {
      summary = run_batch_tbb(processor, files, &g_cancel);
    } else
#endif
    {
      summary = run_batch_parallel(processor, files, cfg.num_workers, &g_cancel);
    }
    summary.log();
    if (!cache.healthy()) {
      spdlog::warn("score cache {} is degraded; some scores were not persisted",
                   cache_path.string());
    }
    return summary.clean() ? kExitClean : kExitIncomplete;
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return kExitFatal;
  } catch (const std::exception& e) {
    spdlog::critical("startup failed: {}", e.what());
    return kExitFatal;
  }
}
