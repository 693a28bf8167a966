#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "chatpack/common.hpp"
#include "chatpack/filter.hpp"
#include "chatpack/writers.hpp"

namespace chatpack {

struct OutputConfig {
  OutputFormat format{OutputFormat::kCsv};
  std::string path;  // empty: optimized_chat.<ext>
  FieldSelection fields{};
  bool pretty{false};
  char csv_delimiter{','};

  std::string resolved_path() const { return path.empty() ? default_output_path(format) : path; }
};

struct PipelineConfig {
  bool merge{true};
  bool streaming{true};
  bool strict{false};
  std::string merge_separator{" | "};
  bool include_system{false};
  bool progress{false};
  bool quiet{false};
  bool verbose{false};
  std::uint64_t progress_interval{10000};
};

struct LoggingConfig {
  bool json{false};
};

struct Config {
  OutputConfig output{};
  FilterConfig filter{};
  PipelineConfig pipeline{};
  LoggingConfig logging{};
};

inline fs::path get_data_dir() {
  return expand_user_path("~/.chatpack");
}

inline fs::path get_config_path() {
  return get_data_dir() / "config.json";
}

inline json default_config_json() {
  return json{
      {"output",
       {
           {"format", "csv"},
           {"path", ""},
           {"timestamps", false},
           {"replies", false},
           {"edited", false},
           {"ids", false},
           {"attachments", false},
           {"pretty", false},
           {"csvDelimiter", ","},
       }},
      {"filter", {{"after", ""}, {"before", ""}, {"from", ""}}},
      {"pipeline",
       {
           {"merge", true},
           {"streaming", true},
           {"strict", false},
           {"mergeSeparator", " | "},
           {"includeSystem", false},
           {"progress", false},
           {"progressInterval", 10000},
           {"quiet", false},
       }},
      {"logging", {{"json", false}}}};
}

// Values in `root` override `cfg`; invalid values throw (ConfigError or
// json::type_error).
inline void apply_config_json(const json& root, Config& cfg) {
  if (!root.is_object()) {
    throw ConfigError("config root must be an object");
  }

  if (root.contains("output") && root["output"].is_object()) {
    const auto& o = root["output"];
    if (o.contains("format")) {
      cfg.output.format = parse_format(o["format"].get<std::string>());
    }
    cfg.output.path = o.value("path", cfg.output.path);
    cfg.output.fields.timestamps = o.value("timestamps", cfg.output.fields.timestamps);
    cfg.output.fields.replies = o.value("replies", cfg.output.fields.replies);
    cfg.output.fields.edited = o.value("edited", cfg.output.fields.edited);
    cfg.output.fields.ids = o.value("ids", cfg.output.fields.ids);
    cfg.output.fields.attachments = o.value("attachments", cfg.output.fields.attachments);
    cfg.output.pretty = o.value("pretty", cfg.output.pretty);
    if (o.contains("csvDelimiter")) {
      const std::string d = o["csvDelimiter"].get<std::string>();
      if (d.size() != 1 || d[0] == '"' || d[0] == '\n' || d[0] == '\r') {
        throw ConfigError("csvDelimiter must be a single character other than a quote or line break");
      }
      cfg.output.csv_delimiter = d[0];
    }
  }

  if (root.contains("filter") && root["filter"].is_object()) {
    const auto& f = root["filter"];
    const std::string after = f.value("after", "");
    const std::string before = f.value("before", "");
    const std::string from = f.value("from", "");
    if (!after.empty()) cfg.filter.with_date_from(after);
    if (!before.empty()) cfg.filter.with_date_to(before);
    if (!from.empty()) cfg.filter.with_sender(from);
  }

  if (root.contains("pipeline") && root["pipeline"].is_object()) {
    const auto& p = root["pipeline"];
    cfg.pipeline.merge = p.value("merge", cfg.pipeline.merge);
    cfg.pipeline.streaming = p.value("streaming", cfg.pipeline.streaming);
    cfg.pipeline.strict = p.value("strict", cfg.pipeline.strict);
    cfg.pipeline.merge_separator = p.value("mergeSeparator", cfg.pipeline.merge_separator);
    cfg.pipeline.include_system = p.value("includeSystem", cfg.pipeline.include_system);
    cfg.pipeline.progress = p.value("progress", cfg.pipeline.progress);
    cfg.pipeline.quiet = p.value("quiet", cfg.pipeline.quiet);
    cfg.pipeline.progress_interval = p.value("progressInterval", cfg.pipeline.progress_interval);
    if (cfg.pipeline.progress_interval == 0) {
      throw ConfigError("progressInterval must be positive");
    }
  }

  if (root.contains("logging") && root["logging"].is_object()) {
    cfg.logging.json = root["logging"].value("json", cfg.logging.json);
  }
}

// A missing file yields defaults. A malformed file is reported and ignored.
inline Config load_config(const fs::path& path = get_config_path()) {
  Config cfg{};
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return cfg;
  }
  const std::string raw = read_text_file(path);
  if (trim(raw).empty()) {
    return cfg;
  }

  try {
    Config parsed{};
    apply_config_json(json::parse(raw), parsed);
    cfg = std::move(parsed);
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, "Failed to parse config " + path.string() + ": " + e.what());
  }
  return cfg;
}

inline bool save_default_config(const fs::path& path = get_config_path()) {
  return write_text_file(path, default_config_json().dump(2) + "\n");
}

}  // namespace chatpack
