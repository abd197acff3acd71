#include "procmaps/parser.hh"
#include "procmaps/error.hh"
#include <iostream>
#include <string>

// Walks a process's smaps one step at a time and only decodes the usage of
// its heap and stack.
int main(int argc, char *argv[]) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <target_pid>\n";
    return 1;
  }

  try {
    pid_t target_pid = std::stoi(argv[1]);
    procmaps::Parser parser(procmaps::OpenFile(procmaps::SmapsPath(target_pid)));

    size_t mappings = 0;
    while (auto mapping = parser.NextMapping()) {
      mappings++;
      if (!mapping->path ||
          (*mapping->path != "[heap]" && *mapping->path != "[stack]")) {
        parser.SkipUsage();
        continue;
      }

      auto usage = parser.NextUsage();
      if (!usage) {
        std::cerr << "Invalid usage block for " << *mapping << "\n";
        continue;
      }
      std::cout << *mapping->path << ": " << *mapping << "\n  " << *usage
                << "\n";
    }
    std::cout << std::dec << mappings << " mappings\n";

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
