#include "error.hh"

namespace procmaps {

const char *ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "I/O error";
  case ErrorKind::MalformedHeader:
    return "malformed header";
  case ErrorKind::MalformedUsage:
    return "malformed usage line";
  case ErrorKind::UnrecognizedKey:
    return "unrecognized key";
  case ErrorKind::UnrecognizedUnit:
    return "unrecognized unit";
  case ErrorKind::UnrecognizedFlag:
    return "unrecognized VM flag";
  }
  return "unknown error";
}

namespace {
std::string FormatMessage(const std::string &message, size_t line) {
  if (line == 0) {
    return message;
  }
  return "line " + std::to_string(line) + ": " + message;
}
} // namespace

Error::Error(ErrorKind kind, const std::string &message, size_t line)
    : std::runtime_error(FormatMessage(message, line)), kind_(kind),
      line_(line) {}

bool Error::IsFormatDrift() const {
  return kind_ == ErrorKind::UnrecognizedKey ||
         kind_ == ErrorKind::UnrecognizedUnit ||
         kind_ == ErrorKind::UnrecognizedFlag;
}

} // namespace procmaps
