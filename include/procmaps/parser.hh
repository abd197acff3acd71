#ifndef __PROCMAPS_PARSER_HH__
#define __PROCMAPS_PARSER_HH__

#include "line_source.hh"
#include "mapping.hh"
#include "usage.hh"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace procmaps {

using Entry = std::pair<Mapping, Usage>;
using MappingFilter = std::function<bool(const Mapping &)>;

/**
 * @brief Single-pass reader for the maps/smaps format
 *
 * A well-formed stream alternates one header line with zero or more detail
 * lines. The parser tracks which of the two it expects next and only accepts
 * the matching step:
 *
 *   ExpectHeader --NextMapping()--> ExpectUsage
 *   ExpectUsage  --NextUsage()----> ExpectHeader
 *   ExpectUsage  --SkipUsage()----> ExpectHeader
 *
 * Calling a step in the wrong state throws std::logic_error. Stream errors are
 * reported as procmaps::Error; I/O errors leave the parser unusable.
 */
class Parser {
public:
  enum class State {
    ExpectHeader,
    ExpectUsage,
  };

  explicit Parser(std::unique_ptr<LineSource> source);

  Parser(const Parser &) = delete;
  Parser &operator=(const Parser &) = delete;
  Parser(Parser &&) = default;
  Parser &operator=(Parser &&) = default;

  State GetState() const { return state_; }
  size_t GetLineNumber() const { return source_->GetLineNumber(); }
  // Line that invalidated the last block NextUsage() rejected, 0 if none.
  size_t GetInvalidLine() const { return invalid_line_; }

  // Reads the next header. Returns std::nullopt at end of input and stays in
  // ExpectHeader. A malformed header consumes only its own line, moves to
  // ExpectUsage and throws Error(MalformedHeader); the caller may SkipUsage()
  // and carry on.
  std::optional<Mapping> NextMapping();

  // Decodes detail lines up to the next header or end of input and moves to
  // ExpectHeader. A line breaking the KEY: VALUE [UNIT] grammar invalidates
  // the block: the rest of it is consumed and std::nullopt is returned.
  // Unknown keys, units or flags consume the rest of the block and throw the
  // matching Error kind.
  std::optional<Usage> NextUsage();

  // Consumes detail lines without decoding them. Never fails on content.
  void SkipUsage();

private:
  void Expect(State state, const char *step) const;
  bool AtDetailLine();
  std::string Take();

  std::unique_ptr<LineSource> source_;
  State state_;
  size_t invalid_line_;
};

// Bulk mode: decodes the usage block of every mapping accepted by filter and
// skips the others. Throws the first error met, including Error(MalformedUsage)
// for an invalid block, so a result is always complete.
std::vector<Entry> ReadFilter(Parser &parser, const MappingFilter &filter);
std::vector<Entry> ReadAll(Parser &parser);

std::vector<Entry> ReadFilter(const std::string &path,
                              const MappingFilter &filter);
std::vector<Entry> ReadAll(const std::string &path);

// Reads /proc/<pid>/smaps. An empty filter accepts every mapping.
std::vector<Entry> ReadProcess(pid_t pid, const MappingFilter &filter = {});

} // namespace procmaps

#endif
