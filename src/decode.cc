#include "decode.hh"
#include "error.hh"
#include <charconv>
#include <limits>
#include <system_error>

namespace procmaps {

namespace {

constexpr std::string_view kWhitespace = " \t\n\v\f\r";

// Pops the next whitespace separated token off the front of text. Returns an
// empty view once text holds no more tokens.
std::string_view NextToken(std::string_view &text) {
  size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    text = std::string_view();
    return text;
  }
  size_t end = text.find_first_of(kWhitespace, begin);
  if (end == std::string_view::npos) {
    end = text.size();
  }
  std::string_view token = text.substr(begin, end - begin);
  text.remove_prefix(end);
  return token;
}

std::string_view Trim(std::string_view text) {
  size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return std::string_view();
  }
  size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

std::optional<uint64_t> ParseUnsigned(std::string_view token, int base) {
  if (token.empty()) {
    return std::nullopt;
  }
  uint64_t value = 0;
  const char *last = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), last, value, base);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

unsigned UnitShift(std::string_view unit) {
  if (unit == "kB") {
    return 10;
  }
  if (unit == "mB") {
    return 20;
  }
  if (unit == "gB") {
    return 30;
  }
  if (unit == "tB") {
    return 40;
  }
  throw Error(ErrorKind::UnrecognizedUnit,
              "Unrecognized unit: " + std::string(unit));
}

} // namespace

std::optional<uint64_t> ParseHex(std::string_view token) {
  return ParseUnsigned(token, 16);
}

std::optional<uint64_t> ParseDecimal(std::string_view token) {
  return ParseUnsigned(token, 10);
}

std::optional<Permissions> ParsePermissions(std::string_view token) {
  if (token.size() != 4) {
    return std::nullopt;
  }

  Permissions permissions;
  switch (token[0]) {
  case '-':
    break;
  case 'r':
    permissions |= Permission::Read;
    break;
  default:
    return std::nullopt;
  }

  switch (token[1]) {
  case '-':
    break;
  case 'w':
    permissions |= Permission::Write;
    break;
  default:
    return std::nullopt;
  }

  switch (token[2]) {
  case '-':
    break;
  case 'x':
    permissions |= Permission::Execute;
    break;
  default:
    return std::nullopt;
  }

  // No "absent" case: every mapping is either shared or private.
  switch (token[3]) {
  case 's':
    permissions |= Permission::Shared;
    break;
  case 'p':
    permissions |= Permission::Private;
    break;
  default:
    return std::nullopt;
  }

  return permissions;
}

std::optional<Device> ParseDevice(std::string_view token) {
  size_t colon = token.find(':');
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto major = ParseHex(token.substr(0, colon));
  auto minor = ParseHex(token.substr(colon + 1));
  constexpr uint64_t kMax = std::numeric_limits<uint32_t>::max();
  if (!major || !minor || *major > kMax || *minor > kMax) {
    return std::nullopt;
  }
  return Device{static_cast<uint32_t>(*major), static_cast<uint32_t>(*minor)};
}

std::optional<std::pair<std::string, uint64_t>>
ParseSizedValue(std::string_view line) {
  std::string_view rest = line;
  std::string_view key = NextToken(rest);
  std::string_view value = NextToken(rest);
  if (key.empty() || value.empty()) {
    return std::nullopt;
  }

  unsigned shift = 0;
  std::string_view unit = NextToken(rest);
  if (!unit.empty()) {
    shift = UnitShift(unit);
  }
  if (!NextToken(rest).empty()) {
    return std::nullopt;
  }

  while (!key.empty() && key.back() == ':') {
    key.remove_suffix(1);
  }

  auto number = ParseDecimal(value);
  if (!number || *number > (std::numeric_limits<uint64_t>::max() >> shift)) {
    return std::nullopt;
  }
  return std::make_pair(std::string(key), *number << shift);
}

VmFlags ParseVmFlags(std::string_view text) {
  VmFlags flags;
  std::string_view rest = text;
  for (std::string_view token = NextToken(rest); !token.empty();
       token = NextToken(rest)) {
    auto flag = VmFlagFromMnemonic(token);
    if (!flag) {
      throw Error(ErrorKind::UnrecognizedFlag,
                  "Unrecognized VM flag: " + std::string(token));
    }
    flags |= *flag;
  }
  return flags;
}

std::optional<Mapping> ParseMapping(std::string_view line) {
  std::string_view rest = line;

  std::string_view range = NextToken(rest);
  size_t dash = range.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto start = ParseHex(range.substr(0, dash));
  auto end = ParseHex(range.substr(dash + 1));
  auto permissions = ParsePermissions(NextToken(rest));
  auto offset = ParseHex(NextToken(rest));
  auto device = ParseDevice(NextToken(rest));
  auto inode = ParseDecimal(NextToken(rest));
  if (!start || !end || !permissions || !offset || !device || !inode) {
    return std::nullopt;
  }

  Mapping mapping;
  mapping.start = *start;
  mapping.end = *end;
  mapping.permissions = *permissions;
  mapping.offset = *offset;
  mapping.device = *device;
  mapping.inode = *inode;

  std::string_view path = Trim(rest);
  if (!path.empty()) {
    mapping.path = std::string(path);
  }
  return mapping;
}

bool IsHeaderLine(std::string_view line) {
  return line.find('-') != std::string_view::npos;
}

} // namespace procmaps
