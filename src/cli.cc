#include "cli.hh"
#include "CLI/CLI.hpp"
#include "error.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>

namespace procmaps {
void SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    // Records go to stdout, so the console sink writes to stderr. Without
    // --verbose it still shows warnings and errors.
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%^%l%$] %v");
    if (!options.verbose) {
      console_sink->set_level(spdlog::level::warn);
    }
    sinks.push_back(console_sink);

    auto logger = std::make_shared<spdlog::logger>("procmaps", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

void CreateCli(CLI::App &app, DumpOptions &options) {
  AddCommonOptions(&app, options);

  auto pid = app.add_option("-p,--pid", options.pid,
                            "Process whose smaps should be read")
                 ->check(CLI::PositiveNumber);
  auto file = app.add_option("-f,--file", options.file,
                             "Read a maps/smaps file instead of /proc")
                  ->check(CLI::ExistingFile);
  pid->excludes(file);

  app.add_option("--path-filter", options.path_filter,
                 "Only decode usage of mappings whose path contains this text");
  app.add_flag("-w,--writable-only", options.writable_only,
               "Only decode usage of writable mappings");
  app.add_flag("-i,--incremental", options.incremental,
               "Step through the file, reporting and skipping bad blocks");
  app.add_flag("-s,--summary-only", options.summary_only,
               "Print totals without the per-mapping listing");
}

std::string InputPath(const DumpOptions &options) {
  if (!options.file.empty()) {
    return options.file;
  }
  if (options.pid > 0) {
    return SmapsPath(options.pid);
  }
  return "/proc/self/smaps";
}

MappingFilter MakeFilter(const DumpOptions &options) {
  if (options.path_filter.empty() && !options.writable_only) {
    return {};
  }
  return [path_filter = options.path_filter,
          writable_only = options.writable_only](const Mapping &mapping) {
    if (writable_only && !mapping.permissions.Has(Permission::Write)) {
      return false;
    }
    if (path_filter.empty()) {
      return true;
    }
    return mapping.path &&
           mapping.path->find(path_filter) != std::string::npos;
  };
}

std::vector<Entry> ReadIncremental(Parser &parser, const MappingFilter &filter) {
  std::vector<Entry> entries;
  size_t rejected = 0;

  while (true) {
    std::optional<Mapping> mapping;
    try {
      mapping = parser.NextMapping();
    } catch (const Error &e) {
      if (e.GetKind() != ErrorKind::MalformedHeader) {
        throw;
      }
      spdlog::warn("{}", e.what());
      parser.SkipUsage();
      rejected++;
      continue;
    }
    if (!mapping) {
      break;
    }

    if (filter && !filter(*mapping)) {
      parser.SkipUsage();
      continue;
    }

    std::optional<Usage> usage;
    try {
      usage = parser.NextUsage();
    } catch (const Error &e) {
      if (!e.IsFormatDrift()) {
        throw;
      }
      spdlog::warn("Dropping mapping {:x}-{:x}: {}", mapping->start,
                   mapping->end, e.what());
      rejected++;
      continue;
    }
    if (!usage) {
      spdlog::warn("Dropping mapping {:x}-{:x}: invalid usage block at line {}",
                   mapping->start, mapping->end, parser.GetInvalidLine());
      rejected++;
      continue;
    }
    entries.emplace_back(std::move(*mapping), std::move(*usage));
  }

  if (rejected > 0) {
    spdlog::warn("{} mappings rejected", rejected);
  }
  return entries;
}

} // namespace procmaps
