/**
 * @file pipeline.cpp
 * @brief Keyframe detection pipeline implementation
 *
 * @details Orchestrates one input end to end:
 *
 *          1. Open the byte source and learn the frame geometry
 *
 *          2. Ingest frames sequentially
 *
 *          3. Score adjacent pairs window by window in parallel
 *
 *          4. Select keyframes
 *
 *          5. Export stills
 *
 *          6. Report
 *
 *          The benchmark repeats 1-4 once per engine configuration.
 */

#include "keyscan/pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <unistd.h>

#include <fmt/core.h>

#include "keyscan/config.hpp"
#include "keyscan/cpu_features.hpp"
#include "keyscan/error.hpp"
#include "keyscan/frame_reader.hpp"
#include "keyscan/keyframe_exporter.hpp"
#include "keyscan/keyframe_selector.hpp"
#include "keyscan/logging.hpp"
#include "keyscan/video_source.hpp"

namespace keyscan {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start, Clock::time_point end) {
  return std::chrono::duration<double, std::milli>(end - start).count();
}

long to_us(double ms) { return static_cast<long>(ms * 1000.0); }

} // anonymous namespace

// **---- Input Kind ----**

InputKind detect_input_kind(const std::string &input) {
  if (input == "-")
    return InputKind::Stdin;
  std::string ext = fs::path(input).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == ".gray" || ext == ".raw" || ext == ".y")
    return InputKind::RawFile;
  return InputKind::Video;
}

// **---- Options ----**

void PipelineOptions::validate() const {
  if (input.empty())
    throw Error(ErrorKind::Configuration, "no input given");

  if (detect_input_kind(input) != InputKind::Video) {
    if (width == 0 || height == 0) {
      throw Error(ErrorKind::Configuration,
                  fmt::format("raw input needs a frame size, got {}x{}",
                              width, height));
    }
  }
  if (engine.block_size == 0)
    throw Error(ErrorKind::Configuration, "block size must be positive");
  if (std::isnan(threshold) || threshold < 0.0) {
    throw Error(ErrorKind::Configuration,
                fmt::format("threshold must be non-negative, got {}",
                            threshold));
  }
  if (std::isnan(frame_rate) || frame_rate < 0.0) {
    throw Error(ErrorKind::Configuration,
                fmt::format("frame rate must not be negative, got {}",
                            frame_rate));
  }
  if (window_frames < 2) {
    throw Error(ErrorKind::Configuration,
                fmt::format("window must hold at least 2 frames, got {}",
                            window_frames));
  }
}

PipelineOptions PipelineOptions::from_env(std::string input,
                                          std::string output_dir) {
  PipelineOptions o;
  o.input = std::move(input);
  o.output_dir = std::move(output_dir);
  o.width = Config::frame_width();
  o.height = Config::frame_height();
  o.frame_rate = Config::frame_rate();
  o.engine.block_size = Config::block_size();
  o.engine.use_simd = Config::use_simd();
  o.threads = Config::threads();
  o.threshold = Config::threshold();
  o.max_frames = Config::max_frames();
  o.max_save = Config::max_save();
  o.window_frames = Config::window_frames();
  o.ffmpeg_path = Config::ffmpeg_path();
  o.test_name = Config::test_name();
  return o;
}

// **---- Pipeline ----**

KeyframePipeline::KeyframePipeline(PipelineOptions options)
    : options_(std::move(options)) {
  options_.validate();
  pool_ = std::make_unique<WorkerPool>(options_.threads);
}

void KeyframePipeline::log_phase(const std::string &msg) {
  LOG_PHASE("{}", msg);
}

PipelineResult KeyframePipeline::analyze(ByteSource &source, size_t width,
                                         size_t height) {
  return analyze_with(options_, source, width, height);
}

PipelineResult KeyframePipeline::analyze_with(const PipelineOptions &opts,
                                              ByteSource &source,
                                              size_t width, size_t height) {
  StreamingFrameReader reader(source, width, height, opts.max_frames);
  DifferenceEngine engine(*pool_, opts.engine);

  log_phase(fmt::format("Analyzing {}x{} frames (threshold {}, {} kernel, "
                        "{} threads)...",
                        width, height, opts.threshold,
                        simd_tier_name(engine.tier()), pool_->size()));

  PipelineResult result;
  double read_ms = 0;
  double score_ms = 0;

  std::vector<FrameBuffer> window;
  window.reserve(opts.window_frames);

  /// Score the window, then keep only its last frame to pair with the next
  auto flush = [&]() {
    if (window.size() < 2)
      return;
    auto start = Clock::now();
    auto scores = engine.scores(window);
    score_ms += elapsed_ms(start, Clock::now());
    result.scores.insert(result.scores.end(), scores.begin(), scores.end());

    FrameBuffer last = std::move(window.back());
    window.clear();
    window.push_back(std::move(last));
  };

  while (true) {
    auto start = Clock::now();
    auto frame = reader.next();
    read_ms += elapsed_ms(start, Clock::now());
    if (!frame)
      break;

    window.push_back(std::move(*frame));
    if (window.size() == opts.window_frames)
      flush();
  }
  flush();

  auto select_start = Clock::now();
  result.keyframes = select_keyframes(result.scores, opts.threshold);
  score_ms += elapsed_ms(select_start, Clock::now());

  TimingCollector::record("read_frames", to_us(read_ms));
  TimingCollector::record("keyframe_analysis", to_us(score_ms));

  LOG_INFO("Read {} frames, found {} keyframes", reader.frames_read(),
           result.keyframes.size());

  RunReport &r = result.report;
  r.test_name = opts.test_name;
  r.frame_extraction_time_ms = read_ms;
  r.keyframe_analysis_time_ms = score_ms;
  r.total_frames = reader.frames_read();
  r.keyframes_extracted = result.keyframes.size();
  r.threshold = opts.threshold;
  r.optimization_type =
      optimization_label(opts.engine.use_simd, opts.engine.block_size);
  r.simd_enabled = opts.engine.use_simd;
  r.simd_tier = simd_tier_name(engine.tier());
  r.threads_used = pool_->size();
  return result;
}

KeyframePipeline::OpenedInput KeyframePipeline::open_input(InputKind kind) {
  log_phase(fmt::format("Opening {}...", options_.input));

  OpenedInput in;
  in.width = options_.width;
  in.height = options_.height;
  in.fps = options_.frame_rate;

  switch (kind) {
  case InputKind::Video: {
    auto video = std::make_unique<VideoByteSource>(options_.input);
    in.width = video->width();
    in.height = video->height();
    if (in.fps <= 0)
      in.fps = video->fps();
    in.source = std::move(video);
    break;
  }
  case InputKind::RawFile:
    in.source = std::make_unique<MappedFileSource>(options_.input);
    in.input_args = fmt::format("-f rawvideo -pix_fmt gray -video_size {}x{}",
                                in.width, in.height);
    if (in.fps > 0)
      in.input_args += fmt::format(" -framerate {}", in.fps);
    break;
  case InputKind::Stdin:
    in.source = std::make_unique<FdByteSource>(STDIN_FILENO);
    break;
  }
  return in;
}

std::string KeyframePipeline::report_name(InputKind kind) const {
  return kind == InputKind::Stdin
             ? std::string("stdin")
             : fs::path(options_.input).filename().string();
}

PipelineResult KeyframePipeline::run() {
  auto total_start = Clock::now();
  const InputKind kind = detect_input_kind(options_.input);

  // **----- PHASE 0: OPEN SOURCE -----**

  OpenedInput in = open_input(kind);

  // **----- PHASE 1-3: INGEST, SCORE, SELECT -----**

  PipelineResult result = analyze(*in.source, in.width, in.height);
  in.source.reset();

  // **----- PHASE 4: EXPORT -----**

  if (!options_.output_dir.empty() && options_.max_save > 0 &&
      !result.keyframes.empty()) {
    if (kind == InputKind::Stdin) {
      LOG_WARN("Stdin cannot be re-read; skipping still export");
    } else if (in.fps <= 0) {
      LOG_WARN("No frame rate known for {}; set FRAME_RATE to export stills",
               options_.input);
    } else {
      log_phase("Exporting keyframes...");
      KeyframeExporter exporter(options_.ffmpeg_path, in.fps, in.input_args);
      result.report.keyframes_saved =
          exporter.export_keyframes(options_.input, result.keyframes,
                                    options_.output_dir, options_.max_save);
    }
  }

  // **----- PHASE 5: REPORT -----**

  RunReport &r = result.report;
  r.video_file = report_name(kind);
  r.total_time_ms = elapsed_ms(total_start, Clock::now());
  r.max_rss_mb = peak_rss_mb();
  r.timestamp = local_timestamp();
  finalize_report(r);

  if (!options_.output_dir.empty()) {
    result.report_file =
        write_json_file(r, options_.output_dir, "processing_report");
    LOG_INFO("Report saved to {}", result.report_file);
  }

  LOG_SUCCESS("Done: {} frames, {} keyframes, {:.1f} FPS", r.total_frames,
              r.keyframes_extracted, r.processing_fps);
  return result;
}

// **---- Benchmark ----**

std::vector<BenchmarkConfig> default_benchmark_configs() {
  return {
      {"Standard Parallel", {8192, false}},
      {"SIMD 8K blocks", {8192, true}},
      {"SIMD 16K blocks", {16384, true}},
      {"SIMD 32K blocks", {32768, true}},
  };
}

BenchmarkResult
KeyframePipeline::benchmark(const std::vector<BenchmarkConfig> &configs) {
  const InputKind kind = detect_input_kind(options_.input);
  if (kind == InputKind::Stdin) {
    throw Error(ErrorKind::Configuration,
                "benchmark needs a file input; stdin cannot be re-read");
  }
  if (configs.empty())
    throw Error(ErrorKind::Configuration, "no benchmark configurations");

  LOG_PHASE("Benchmark suite: {} configurations on {}", configs.size(),
            options_.input);
  LOG_INFO("Time: {}", local_timestamp());
  LOG_INFO("Threads: {}", pool_->size());
  LOG_INFO("Best SIMD tier: {}", simd_tier_name(best_simd_tier()));

  BenchmarkResult bench;
  for (const BenchmarkConfig &config : configs) {
    PipelineOptions opts = options_;
    opts.test_name = config.name;
    opts.engine = config.engine;
    if (opts.max_frames == 0 || opts.max_frames > BENCHMARK_MAX_FRAMES)
      opts.max_frames = BENCHMARK_MAX_FRAMES;
    opts.validate();

    log_phase(fmt::format("Running test: {}", config.name));
    auto total_start = Clock::now();
    OpenedInput in = open_input(kind);
    PipelineResult result = analyze_with(opts, *in.source, in.width,
                                         in.height);
    in.source.reset();

    RunReport &r = result.report;
    r.video_file = report_name(kind);
    r.total_time_ms = elapsed_ms(total_start, Clock::now());
    r.max_rss_mb = peak_rss_mb();
    r.timestamp = local_timestamp();
    finalize_report(r);
    bench.runs.push_back(std::move(result));
  }

  for (size_t i = 1; i < bench.runs.size(); ++i) {
    if (bench.runs[i].report.processing_fps >
        bench.runs[bench.best].report.processing_fps)
      bench.best = i;
  }

  // **----- COMPARISON TABLE -----**

  LOG_PHASE("Benchmark Results");
  LOG_INFO("{:<20} {:>12} {:>12} {:>12} {:>12} {:>8} {:>10} {:>8}  {}",
           "Test", "Total(ms)", "Extract(ms)", "Analyze(ms)", "Speed(FPS)",
           "Frames", "Keyframes", "Threads", "Optimization");
  nlohmann::json reports = nlohmann::json::array();
  for (const PipelineResult &run : bench.runs) {
    const RunReport &r = run.report;
    LOG_INFO("{:<20} {:>12.1f} {:>12.1f} {:>12.1f} {:>12.1f} {:>8} {:>10} "
             "{:>8}  {}",
             r.test_name, r.total_time_ms, r.frame_extraction_time_ms,
             r.keyframe_analysis_time_ms, r.processing_fps, r.total_frames,
             r.keyframes_extracted, r.threads_used, r.optimization_type);
    reports.push_back(nlohmann::json(r));
  }

  const RunReport &best = bench.runs[bench.best].report;
  LOG_SUCCESS("Best performance: {} at {:.1f} FPS ({:.2f}s total, {:.2f}s "
              "analysis, {})",
              best.test_name, best.processing_fps,
              best.total_time_ms / 1000.0,
              best.keyframe_analysis_time_ms / 1000.0,
              best.optimization_type);

  if (!options_.output_dir.empty()) {
    bench.results_file =
        write_json_file(reports, options_.output_dir, "benchmark_results");
    LOG_INFO("Detailed results saved to {}", bench.results_file);
  }
  return bench;
}

} // namespace keyscan
