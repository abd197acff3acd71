#ifndef __PROCMAPS_CLI_HH__
#define __PROCMAPS_CLI_HH__
#include "CLI/App.hpp"
#include "parser.hh"
#include "spdlog/common.h"
#include <string>
#include <sys/types.h>
#include <vector>

namespace procmaps {

struct CommonOptions {
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

struct DumpOptions : CommonOptions {
  pid_t pid{0}; // 0 reads the tool's own smaps
  std::string file;
  std::string path_filter;
  bool writable_only{false};
  bool incremental{false};
  bool summary_only{false};
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
void CreateCli(CLI::App &app, DumpOptions &options);
void SetupLogging(const CommonOptions &options);

// File to read: --file, else /proc/<pid>/smaps, else /proc/self/smaps.
std::string InputPath(const DumpOptions &options);

// Empty when no option restricts which usage blocks are decoded.
MappingFilter MakeFilter(const DumpOptions &options);

// Caller-driven walk: bad headers and bad blocks are logged as warnings and
// skipped instead of aborting the whole read. I/O errors still propagate.
std::vector<Entry> ReadIncremental(Parser &parser, const MappingFilter &filter);

} // namespace procmaps
#endif
