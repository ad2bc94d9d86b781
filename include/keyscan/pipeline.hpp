/**
 * @file pipeline.hpp
 * @brief Keyframe detection pipeline orchestration
 *
 * @details KeyframePipeline runs one input end to end:
 *
 *          1. Open the byte source (decoded video, raw gray8 file, stdin)
 *
 *          2. Ingest frames sequentially with StreamingFrameReader
 *
 *          3. Score adjacent pairs window by window on the WorkerPool
 *
 *          4. Select keyframes above the threshold
 *
 *          5. Export stills through ffmpeg (optional)
 *
 *          6. Fill a RunReport
 *
 *          benchmark() instead repeats steps 1-4 once per engine
 *          configuration and compares the runs.
 *
 * @note Windows of window_frames frames overlap by one frame, so memory is
 *       bounded by the window while the scores equal those of a single
 *       pass over the whole sequence.
 */

#ifndef KEYSCAN_PIPELINE_HPP
#define KEYSCAN_PIPELINE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "difference_engine.hpp"
#include "report.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

namespace keyscan {

enum class InputKind { Video, RawFile, Stdin };

/// "-" is stdin, .gray/.raw/.y (any case) are raw files, the rest video.
InputKind detect_input_kind(const std::string &input);

struct PipelineOptions {
  std::string input;
  std::string output_dir;  //< Stills directory (empty = no export)
  size_t width = 0;        //< Raw input only
  size_t height = 0;       //< Raw input only
  double frame_rate = 0;   //< 0 = read from the video stream
  EngineOptions engine;
  size_t threads = 0;      //< 0 = auto-detect
  double threshold = DEFAULT_THRESHOLD;
  size_t max_frames = 0;   //< 0 = whole stream
  size_t max_save = DEFAULT_MAX_SAVE;
  size_t window_frames = DEFAULT_WINDOW_FRAMES;
  std::string ffmpeg_path = "ffmpeg";
  std::string test_name = "Single Processing";

  /**
   * @brief Check values before any work starts.
   * @throw Error (Configuration) naming the first invalid value
   */
  void validate() const;

  /// Options from the Config environment accessors.
  static PipelineOptions from_env(std::string input, std::string output_dir);
};

struct PipelineResult {
  std::vector<double> scores;    //< One per adjacent pair
  std::vector<size_t> keyframes; //< Second frame of each selected pair
  RunReport report;
  std::string report_file;       //< processing_report_*.json, if written
};

/// One engine setting compared by KeyframePipeline::benchmark().
struct BenchmarkConfig {
  std::string name;
  EngineOptions engine;
};

/// Scalar at 8K blocks, then SIMD at 8K, 16K and 32K blocks.
std::vector<BenchmarkConfig> default_benchmark_configs();

struct BenchmarkResult {
  std::vector<PipelineResult> runs; //< One per config, in config order
  size_t best = 0;                  //< Index of the highest processing_fps
  std::string results_file;         //< benchmark_results_*.json, if written
};

class KeyframePipeline {
public:
  /// @throw Error (Configuration) if the options are invalid
  explicit KeyframePipeline(PipelineOptions options);

  /**
   * @brief Run the whole pipeline on options.input.
   * @throw Error (IO) on source or file system failures
   */
  PipelineResult run();

  /**
   * @brief Analyze options.input once per config and compare the runs.
   * @details Each run reopens the input and ingests at most
   *          BENCHMARK_MAX_FRAMES frames. No stills are exported. The
   *          comparison table is logged, and the reports are written as a
   *          JSON array to output_dir when it is set.
   * @throw Error (Configuration) for stdin input or an empty config list
   * @throw Error (IO) on source or file system failures
   */
  BenchmarkResult benchmark(const std::vector<BenchmarkConfig> &configs);

  /**
   * @brief Score and select frames from an already opened source.
   * @note No export; report timings cover ingestion and analysis.
   */
  PipelineResult analyze(ByteSource &source, size_t width, size_t height);

private:
  struct OpenedInput {
    std::unique_ptr<ByteSource> source;
    size_t width = 0;
    size_t height = 0;
    double fps = 0;
    std::string input_args; //< ffmpeg input options for raw files
  };

  OpenedInput open_input(InputKind kind);
  std::string report_name(InputKind kind) const;
  PipelineResult analyze_with(const PipelineOptions &opts, ByteSource &source,
                              size_t width, size_t height);
  void log_phase(const std::string &msg);

  PipelineOptions options_;
  std::unique_ptr<WorkerPool> pool_;
};

} // namespace keyscan

#endif // KEYSCAN_PIPELINE_HPP
