#include "cli.hh"
#include "error.hh"
#include "parser.hh"
#include "summary.hh"
#include <CLI/CLI.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {
using namespace procmaps;

void PrintEntries(const std::vector<Entry> &entries) {
  for (const auto &[mapping, usage] : entries) {
    std::cout << std::hex << std::setfill('0') << std::setw(16)
              << mapping.start << '-' << std::setw(16) << mapping.end
              << std::setfill(' ') << std::dec << ' ' << mapping.permissions
              << std::setw(10) << (usage.rss >> 10) << " kB rss"
              << std::setw(10) << (usage.pss >> 10) << " kB pss"
              << std::setw(10) << (usage.swap >> 10) << " kB swap  "
              << mapping.path.value_or("[anon]") << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"procmaps_dump - decodes a process's smaps into per-mapping "
               "memory usage"};
  DumpOptions options;
  CreateCli(app, options);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  SetupLogging(options);

  const std::string path = InputPath(options);
  const MappingFilter filter = MakeFilter(options);
  spdlog::info("Reading {}", path);

  try {
    auto start_time = std::chrono::steady_clock::now();
    std::vector<Entry> entries;
    if (options.incremental) {
      Parser parser(OpenFile(path));
      entries = ReadIncremental(parser, filter);
    } else {
      entries = ReadFilter(path, filter);
    }
    auto end_time = std::chrono::steady_clock::now();

    if (!options.summary_only) {
      PrintEntries(entries);
    }
    std::cout << Summarize(entries) << "\n  Parse time:     "
              << std::chrono::duration_cast<std::chrono::milliseconds>(
                     end_time - start_time)
                     .count()
              << " ms" << std::endl;
  } catch (const Error &e) {
    spdlog::error("{} ({})", e.what(), ToString(e.GetKind()));
    return 1;
  }

  return 0;
}
