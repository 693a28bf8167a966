#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "chatpack/config.hpp"
#include "chatpack/filter.hpp"
#include "chatpack/merge.hpp"
#include "chatpack/metrics.hpp"
#include "chatpack/parser.hpp"
#include "chatpack/writers.hpp"

namespace chatpack {

using ProgressFn = std::function<void(uint64_t parsed)>;

// Splits parser output into messages and per-record errors. Errors are
// counted and logged, or abort the run in strict mode.
class ErrorGate : public MessageSource {
 public:
  ErrorGate(RecordSource& upstream, Metrics& metrics, const PipelineConfig& cfg, ProgressFn progress)
      : upstream_(upstream), metrics_(metrics), cfg_(cfg), progress_(std::move(progress)) {}

  std::optional<Message> next() override {
    while (auto record = upstream_.next()) {
      if (auto* error = std::get_if<ParseError>(&*record)) {
        if (cfg_.strict) {
          throw FileFatalError("aborting on first bad record: " + error->describe());
        }
        metrics_.inc("parse_errors");
        Logger::log(Logger::Level::kWarn, "skipped " + error->describe());
        continue;
      }
      metrics_.inc("parsed");
      const uint64_t parsed = metrics_.get("parsed");
      if (progress_ && cfg_.progress_interval > 0 && parsed % cfg_.progress_interval == 0) {
        progress_(parsed);
      }
      return std::get<Message>(std::move(*record));
    }
    return std::nullopt;
  }

 private:
  RecordSource& upstream_;
  Metrics& metrics_;
  const PipelineConfig& cfg_;
  ProgressFn progress_;
};

namespace detail {

inline void require_input(const fs::path& input) {
  std::error_code ec;
  if (!fs::exists(input, ec) || fs::is_directory(input, ec)) {
    throw FileFatalError("Input file not found: " + input.string());
  }
}

inline std::ofstream open_output(const fs::path& path) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    throw OutputIOError("cannot create output file: " + path.string());
  }
  return out;
}

inline void write_all(MessageSource& source, const Config& cfg, Metrics& metrics) {
  const fs::path path = cfg.output.resolved_path();
  std::ofstream out = open_output(path);
  WriterOptions options;
  options.fields = cfg.output.fields;
  options.pretty = cfg.output.pretty;
  options.csv_delimiter = cfg.output.csv_delimiter;
  auto writer = make_writer(cfg.output.format, out, options);
  try {
    writer->begin();
    while (auto m = source.next()) {
      writer->write(*m);
    }
    writer->finish();
  } catch (const FileFatalError&) {
    // Input went bad mid-stream; drop the partial output.
    out.close();
    std::error_code ec;
    fs::remove(path, ec);
    throw;
  }
  out.close();
  if (out.fail()) {
    throw OutputIOError("failed to close output file: " + path.string());
  }
  metrics.inc("written", writer->written());
}

inline MergeOptions merge_options(const PipelineConfig& cfg) {
  MergeOptions options;
  options.separator = cfg.merge_separator;
  return options;
}

}  // namespace detail

// Completion line for records skipped as malformed. Reported even under
// --quiet, where the per-record warnings are suppressed.
inline std::optional<std::string> skipped_records_note(const Metrics& metrics) {
  const uint64_t skipped = metrics.get("parse_errors");
  if (skipped == 0) {
    return std::nullopt;
  }
  return "skipped " + std::to_string(skipped) + " malformed record" + (skipped == 1 ? "" : "s");
}

// Parse -> filter -> merge -> write. The output file is created only after
// the input has been validated (streaming) or fully processed (buffered), and
// is removed again if the input turns out to be broken mid-stream.
inline Metrics run_pipeline(Platform platform, const fs::path& input, const Config& cfg,
                            ProgressFn progress = nullptr) {
  Metrics metrics;
  detail::require_input(input);
  const PlatformParser parser = make_parser(platform, ParserOptions{cfg.pipeline.include_system});

  if (cfg.pipeline.streaming) {
    std::ifstream in(input, std::ios::in | std::ios::binary);
    if (!in) {
      throw FileFatalError("cannot open input file: " + input.string());
    }
    auto records = open_stream(parser, in);
    ErrorGate gate(*records, metrics, cfg.pipeline, std::move(progress));
    FilterSource filtered(gate, cfg.filter);
    if (cfg.pipeline.merge) {
      MergeSource merged(filtered, detail::merge_options(cfg.pipeline));
      detail::write_all(merged, cfg, metrics);
      metrics.inc("merged_away", merged.merged_away());
    } else {
      detail::write_all(filtered, cfg, metrics);
    }
    metrics.inc("filtered_out", filtered.rejected());
    return metrics;
  }

  std::ifstream in(input, std::ios::in | std::ios::binary);
  if (!in) {
    throw FileFatalError("cannot open input file: " + input.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  auto records = open_buffer(parser, ss.str());
  ErrorGate gate(*records, metrics, cfg.pipeline, std::move(progress));
  std::vector<Message> messages = drain(gate);

  VectorSource parsed(std::move(messages));
  FilterSource filtered(parsed, cfg.filter);
  messages = drain(filtered);
  metrics.inc("filtered_out", filtered.rejected());

  if (cfg.pipeline.merge) {
    VectorSource kept(std::move(messages));
    MergeSource merged(kept, detail::merge_options(cfg.pipeline));
    messages = drain(merged);
    metrics.inc("merged_away", merged.merged_away());
  }

  VectorSource final_messages(std::move(messages));
  detail::write_all(final_messages, cfg, metrics);
  return metrics;
}

}  // namespace chatpack
