#include "parser.hh"
#include "decode.hh"
#include "error.hh"
#include "spdlog/fmt/fmt.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string_view>

namespace procmaps {

namespace {

constexpr std::string_view kFlagsTag = "VmFlags";

// Folds one detail line into usage. Returns false when the line breaks the
// KEY: VALUE [UNIT] grammar; throws for vocabulary outside the known set.
bool ApplyUsageLine(std::string_view line, Usage &usage) {
  if (line.substr(0, kFlagsTag.size()) == kFlagsTag) {
    line.remove_prefix(kFlagsTag.size());
    if (!line.empty() && line.front() == ':') {
      line.remove_prefix(1);
    }
    usage.vm_flags = ParseVmFlags(line);
    return true;
  }

  auto sized = ParseSizedValue(line);
  if (!sized) {
    return false;
  }

  const auto &[key, value] = *sized;
  if (uint64_t Usage::*field = FindUsageField(key)) {
    usage.*field = value;
  } else if (key == "THPeligible") {
    usage.thp_eligible = value != 0;
  } else if (key == "ProtectionKey") {
    usage.protection_key = value;
  } else {
    throw Error(ErrorKind::UnrecognizedKey, "Unrecognized key: " + key);
  }
  return true;
}

} // namespace

Parser::Parser(std::unique_ptr<LineSource> source)
    : source_(std::move(source)), state_(State::ExpectHeader),
      invalid_line_(0) {
  if (!source_) {
    throw std::invalid_argument("Null line source");
  }
}

void Parser::Expect(State state, const char *step) const {
  if (state_ != state) {
    throw std::logic_error(std::string(step) + " called out of order");
  }
}

bool Parser::AtDetailLine() {
  const std::string *line = source_->Peek();
  return line != nullptr && !IsHeaderLine(*line);
}

std::string Parser::Take() {
  std::optional<std::string> line = source_->Next();
  if (!line) {
    throw std::logic_error("Line source exhausted after a successful peek");
  }
  return std::move(*line);
}

std::optional<Mapping> Parser::NextMapping() {
  Expect(State::ExpectHeader, "NextMapping");

  std::optional<std::string> line = source_->Next();
  if (!line) {
    return std::nullopt;
  }

  // The lines after a bad header still belong to it.
  state_ = State::ExpectUsage;
  std::optional<Mapping> mapping = ParseMapping(*line);
  if (!mapping) {
    throw Error(ErrorKind::MalformedHeader, "Failed to parse mapping: " + *line,
                source_->GetLineNumber());
  }
  return mapping;
}

std::optional<Usage> Parser::NextUsage() {
  Expect(State::ExpectUsage, "NextUsage");

  Usage usage;
  bool valid = true;
  std::optional<Error> fatal;
  invalid_line_ = 0;

  // Once the block is known to be bad, keep draining it so the next call
  // starts on a header.
  while (AtDetailLine()) {
    std::string line = Take();
    if (!valid || fatal) {
      continue;
    }
    try {
      valid = ApplyUsageLine(line, usage);
    } catch (const Error &e) {
      fatal.emplace(e.GetKind(), e.what(), source_->GetLineNumber());
      continue;
    }
    if (!valid) {
      invalid_line_ = source_->GetLineNumber();
      spdlog::warn("Invalid usage line {}: '{}'", source_->GetLineNumber(),
                   line);
    }
  }
  state_ = State::ExpectHeader;

  if (fatal) {
    spdlog::error("Format drift: {}", fatal->what());
    throw *fatal;
  }
  if (!valid) {
    return std::nullopt;
  }
  return usage;
}

void Parser::SkipUsage() {
  Expect(State::ExpectUsage, "SkipUsage");

  size_t skipped = 0;
  while (AtDetailLine()) {
    Take();
    skipped++;
  }
  state_ = State::ExpectHeader;
  spdlog::debug("Skipped {} usage lines", skipped);
}

std::vector<Entry> ReadFilter(Parser &parser, const MappingFilter &filter) {
  std::vector<Entry> entries;

  while (std::optional<Mapping> mapping = parser.NextMapping()) {
    if (filter && !filter(*mapping)) {
      parser.SkipUsage();
      continue;
    }

    std::optional<Usage> usage = parser.NextUsage();
    if (!usage) {
      throw Error(ErrorKind::MalformedUsage,
                  fmt::format("Invalid usage block for mapping {:x}-{:x}",
                              mapping->start, mapping->end),
                  parser.GetInvalidLine());
    }
    entries.emplace_back(std::move(*mapping), std::move(*usage));
  }

  return entries;
}

std::vector<Entry> ReadAll(Parser &parser) { return ReadFilter(parser, {}); }

std::vector<Entry> ReadFilter(const std::string &path,
                              const MappingFilter &filter) {
  Parser parser(OpenFile(path));
  std::vector<Entry> entries = ReadFilter(parser, filter);
  spdlog::debug("Read {} mappings from {}", entries.size(), path);
  return entries;
}

std::vector<Entry> ReadAll(const std::string &path) {
  return ReadFilter(path, {});
}

std::vector<Entry> ReadProcess(pid_t pid, const MappingFilter &filter) {
  return ReadFilter(SmapsPath(pid), filter);
}

} // namespace procmaps
