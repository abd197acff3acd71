#ifndef __PROCMAPS_LINE_SOURCE_HH__
#define __PROCMAPS_LINE_SOURCE_HH__

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace procmaps {

// Pull-based line reader with one line of lookahead. Read failures throw
// procmaps::Error with kind Io.
class LineSource {
public:
  virtual ~LineSource() = default;

  // Next line without consuming it, or nullptr at end of input. The pointer
  // stays valid until the next call to Next().
  virtual const std::string *Peek() = 0;

  // Consumes and returns the next line, or std::nullopt at end of input.
  virtual std::optional<std::string> Next() = 0;

  // Number of lines consumed so far.
  virtual size_t GetLineNumber() const = 0;
};

class StreamLineSource : public LineSource {
public:
  // name is only used in error messages.
  StreamLineSource(std::unique_ptr<std::istream> stream, std::string name);

  StreamLineSource(const StreamLineSource &) = delete;
  StreamLineSource &operator=(const StreamLineSource &) = delete;

  const std::string *Peek() override;
  std::optional<std::string> Next() override;
  size_t GetLineNumber() const override { return consumed_; }

private:
  void Fill();

  std::unique_ptr<std::istream> stream_;
  std::string name_;
  std::optional<std::string> lookahead_;
  bool exhausted_;
  size_t consumed_;
};

// Throws Error(Io) if the file cannot be opened.
std::unique_ptr<LineSource> OpenFile(const std::string &path);

std::unique_ptr<LineSource> FromString(std::string text);

std::string SmapsPath(pid_t pid);
std::string MapsPath(pid_t pid);

} // namespace procmaps

#endif
