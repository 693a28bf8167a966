#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "chatpack/config.hpp"
#include "chatpack/pipeline.hpp"

namespace {

using namespace chatpack;

void print_usage() {
  std::cout
      << "chatpack - compress chat exports for LLM context and RAG ingestion\n\n"
      << "Usage:\n"
      << "  chatpack <source> <input> [options]\n"
      << "  chatpack init-config [PATH]\n"
      << "  chatpack --version\n\n"
      << "Sources:\n"
      << "  tg, telegram     Telegram Desktop JSON export (result.json)\n"
      << "  wa, whatsapp     WhatsApp \"Export chat\" text file\n"
      << "  ig, instagram    Instagram message_N.json\n"
      << "  dc, discord      DiscordChatExporter JSON or TXT, Discrub JSON\n\n"
      << "Options:\n"
      << "  -o, --output PATH       output file (default optimized_chat.<ext>)\n"
      << "  -f, --format FORMAT     csv | json | jsonl (default csv)\n"
      << "  -t, --timestamps        include timestamps\n"
      << "  -r, --replies           include reply ids and forward origin\n"
      << "  -e, --edited            include edit timestamps\n"
      << "      --ids               include message ids\n"
      << "      --attachments       include attachment descriptors\n"
      << "      --no-merge          keep consecutive messages separate\n"
      << "      --after DATE        only messages on or after DATE (YYYY-MM-DD)\n"
      << "      --before DATE       only messages on or before DATE (YYYY-MM-DD)\n"
      << "      --from USER         only messages from USER (exact match)\n"
      << "      --no-streaming      load the whole file before processing\n"
      << "      --include-system    keep service and system messages\n"
      << "      --strict            abort on the first malformed record\n"
      << "      --pretty            indent JSON output\n"
      << "      --config PATH       config file (default ~/.chatpack/config.json)\n"
      << "  -p, --progress          report progress\n"
      << "  -q, --quiet             errors only\n"
      << "      --verbose           debug logging\n\n"
      << "Examples:\n"
      << "  chatpack tg result.json\n"
      << "  chatpack wa chat.txt -t -f json\n"
      << "  chatpack dc export.json --after 2024-01-01\n";
}

const std::vector<std::string>& value_flags() {
  static const std::vector<std::string> flags = {"-o", "--output", "-f", "--format", "--after",
                                                 "--before", "--from", "--config"};
  return flags;
}

const std::vector<std::string>& switch_flags() {
  static const std::vector<std::string> flags = {
      "-t", "--timestamps", "-r", "--replies", "-e", "--edited", "--ids", "--attachments", "--no-merge",
      "--no-streaming", "--include-system", "--strict", "--pretty", "-p", "--progress", "-q", "--quiet",
      "--verbose"};
  return flags;
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

bool has_any(const std::vector<std::string>& args, const std::string& short_flag, const std::string& long_flag) {
  return has_flag(args, short_flag) || has_flag(args, long_flag);
}

std::optional<std::string> get_flag_value(const std::vector<std::string>& args, const std::string& flag) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == flag) {
      if (i + 1 >= args.size()) {
        throw ConfigError("missing value for " + flag);
      }
      return args[i + 1];
    }
  }
  return std::nullopt;
}

std::optional<std::string> get_flag_value(const std::vector<std::string>& args, const std::string& short_flag,
                                          const std::string& long_flag) {
  if (auto v = get_flag_value(args, long_flag)) {
    return v;
  }
  return get_flag_value(args, short_flag);
}

// Positional arguments, rejecting unknown options.
std::vector<std::string> positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (std::find(value_flags().begin(), value_flags().end(), a) != value_flags().end()) {
      ++i;
      continue;
    }
    if (std::find(switch_flags().begin(), switch_flags().end(), a) != switch_flags().end()) {
      continue;
    }
    if (a.size() > 1 && a[0] == '-') {
      throw ConfigError("unknown option '" + a + "'");
    }
    out.push_back(a);
  }
  return out;
}

// Command-line flags override the config file.
void apply_flags(const std::vector<std::string>& args, Config& cfg) {
  if (auto v = get_flag_value(args, "-o", "--output")) cfg.output.path = *v;
  if (auto v = get_flag_value(args, "-f", "--format")) cfg.output.format = parse_format(*v);
  if (has_any(args, "-t", "--timestamps")) cfg.output.fields.timestamps = true;
  if (has_any(args, "-r", "--replies")) cfg.output.fields.replies = true;
  if (has_any(args, "-e", "--edited")) cfg.output.fields.edited = true;
  if (has_flag(args, "--ids")) cfg.output.fields.ids = true;
  if (has_flag(args, "--attachments")) cfg.output.fields.attachments = true;
  if (has_flag(args, "--pretty")) cfg.output.pretty = true;

  if (auto v = get_flag_value(args, "--after")) cfg.filter.with_date_from(*v);
  if (auto v = get_flag_value(args, "--before")) cfg.filter.with_date_to(*v);
  if (auto v = get_flag_value(args, "--from")) cfg.filter.with_sender(*v);

  if (has_flag(args, "--no-merge")) cfg.pipeline.merge = false;
  if (has_flag(args, "--no-streaming")) cfg.pipeline.streaming = false;
  if (has_flag(args, "--include-system")) cfg.pipeline.include_system = true;
  if (has_flag(args, "--strict")) cfg.pipeline.strict = true;
  if (has_any(args, "-p", "--progress")) cfg.pipeline.progress = true;
  if (has_any(args, "-q", "--quiet")) cfg.pipeline.quiet = true;
  if (has_flag(args, "--verbose")) cfg.pipeline.verbose = true;
}

void configure_logging(const Config& cfg) {
  const char* v = std::getenv("CHATPACK_LOG_JSON");
  if ((v && *v && std::string(v) != "0") || cfg.logging.json) {
    Logger::set_json(true);
  }
  if (cfg.pipeline.quiet) {
    Logger::set_min_level(Logger::Level::kError);
  } else if (cfg.pipeline.verbose) {
    Logger::set_min_level(Logger::Level::kDebug);
  }
}

void print_summary(Platform platform, const Config& cfg, const Metrics& metrics) {
  const std::string output = cfg.output.resolved_path();
  if (Logger::json_enabled()) {
    json j = metrics.to_json();
    j["source"] = platform_name(platform);
    j["output"] = output;
    j["format"] = format_name(cfg.output.format);
    std::cerr << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    return;
  }
  const uint64_t parsed = metrics.get("parsed");
  const uint64_t kept = parsed - metrics.get("filtered_out");
  std::cerr << "\nDone!\n";
  std::cerr << "  Parsed:   " << parsed << " messages\n";
  if (metrics.get("parse_errors") > 0) {
    std::cerr << "  Skipped:  " << metrics.get("parse_errors") << " malformed records\n";
  }
  if (cfg.filter.is_active()) {
    std::cerr << "  Filtered: " << kept << " messages\n";
  }
  if (cfg.pipeline.merge && metrics.get("merged_away") > 0) {
    std::cerr << "  Merged:   " << kept << " -> " << metrics.get("written") << " entries\n";
  }
  std::cerr << "  Output:   " << output << " (" << format_name(cfg.output.format) << ", "
            << metrics.elapsed_ms() << " ms)\n";
}

int run_init_config(const std::vector<std::string>& args) {
  const fs::path path = args.empty() ? get_config_path() : expand_user_path(args[0]);
  if (!save_default_config(path)) {
    Logger::log(Logger::Level::kError, "cannot write config file: " + path.string());
    return 1;
  }
  std::cout << "Wrote default config to " << path.string() << "\n";
  return 0;
}

int run_convert(const std::vector<std::string>& args) {
  const auto pos = positionals(args);
  if (pos.size() != 2) {
    throw ConfigError("expected <source> <input>; see chatpack --help");
  }
  const Platform platform = parse_platform(pos[0]);
  const fs::path input = expand_user_path(pos[1]);

  const auto config_path = get_flag_value(args, "--config");
  Config cfg = load_config(config_path ? expand_user_path(*config_path) : get_config_path());
  apply_flags(args, cfg);
  configure_logging(cfg);

  Logger::log(Logger::Level::kInfo,
              std::string("Parsing ") + platform_name(platform) + " export: " + input.string());

  bool progress_shown = false;
  ProgressFn progress;
  if (cfg.pipeline.progress && !cfg.pipeline.quiet) {
    progress = [&progress_shown](uint64_t parsed) {
      std::cerr << "\rProcessed " << parsed << " messages..." << std::flush;
      progress_shown = true;
    };
  }

  const Metrics metrics = run_pipeline(platform, input, cfg, progress);
  if (progress_shown) {
    std::cerr << "\n";
  }
  if (!cfg.pipeline.quiet) {
    print_summary(platform, cfg, metrics);
  } else if (const auto note = skipped_records_note(metrics)) {
    Logger::log(Logger::Level::kError, *note);
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("CHATPACK_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 2;
  }

  const std::string command = args[1];

  if (command == "--version" || command == "-V") {
    std::cout << "chatpack " << kVersion << "\n";
    return 0;
  }
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  try {
    if (command == "init-config") {
      std::vector<std::string> sub(args.begin() + 2, args.end());
      return run_init_config(sub);
    }
    std::vector<std::string> sub(args.begin() + 1, args.end());
    return run_convert(sub);
  } catch (const ConfigError& e) {
    Logger::log(Logger::Level::kError, e.what());
    return 2;
  } catch (const FileFatalError& e) {
    Logger::log(Logger::Level::kError, e.what());
    return 1;
  } catch (const OutputIOError& e) {
    Logger::log(Logger::Level::kError, e.what());
    return 1;
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kError, std::string("unexpected error: ") + e.what());
    return 1;
  }
}
