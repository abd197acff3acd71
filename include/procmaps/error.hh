#ifndef __PROCMAPS_ERROR_HH__
#define __PROCMAPS_ERROR_HH__

#include <cstddef>
#include <stdexcept>
#include <string>

namespace procmaps {

enum class ErrorKind {
  Io,               // The line source could not produce the next line
  MalformedHeader,  // A header line failed to decode
  MalformedUsage,   // A detail line broke the KEY: VALUE [UNIT] grammar
  UnrecognizedKey,  // Detail key outside the known set
  UnrecognizedUnit, // Size unit outside kB/mB/gB/tB
  UnrecognizedFlag, // VmFlags mnemonic outside the known set
};

const char *ToString(ErrorKind kind);

class Error : public std::runtime_error {
public:
  // line is 1-based; 0 when the error is not tied to an input line.
  Error(ErrorKind kind, const std::string &message, size_t line = 0);

  ErrorKind GetKind() const { return kind_; }
  size_t GetLine() const { return line_; }

  // True when the input uses vocabulary this parser does not know, i.e. the
  // kernel format has moved on.
  bool IsFormatDrift() const;

private:
  ErrorKind kind_;
  size_t line_;
};

} // namespace procmaps

#endif
