#include "line_source.hh"
#include "error.hh"
#include "spdlog/spdlog.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace procmaps {

StreamLineSource::StreamLineSource(std::unique_ptr<std::istream> stream,
                                   std::string name)
    : stream_(std::move(stream)), name_(std::move(name)), exhausted_(false),
      consumed_(0) {
  if (!stream_) {
    throw std::invalid_argument("Null input stream");
  }
}

void StreamLineSource::Fill() {
  if (lookahead_ || exhausted_) {
    return;
  }

  errno = 0;
  std::string line;
  if (std::getline(*stream_, line)) {
    lookahead_ = std::move(line);
    return;
  }

  if (stream_->bad()) {
    const int saved_errno = errno;
    std::string reason =
        saved_errno != 0 ? strerror(saved_errno) : "stream read failure";
    throw Error(ErrorKind::Io, "Failed to read " + name_ + ": " + reason,
                consumed_ + 1);
  }
  exhausted_ = true;
}

const std::string *StreamLineSource::Peek() {
  Fill();
  return lookahead_ ? &*lookahead_ : nullptr;
}

std::optional<std::string> StreamLineSource::Next() {
  Fill();
  if (!lookahead_) {
    return std::nullopt;
  }
  std::optional<std::string> line = std::move(lookahead_);
  lookahead_.reset();
  consumed_++;
  return line;
}

std::unique_ptr<LineSource> OpenFile(const std::string &path) {
  auto file = std::make_unique<std::ifstream>(path);
  if (!file->is_open()) {
    std::string reason = strerror(errno);
    spdlog::error("Failed to open {}: {}", path, reason);
    throw Error(ErrorKind::Io, "Failed to open " + path + ": " + reason);
  }
  spdlog::debug("Opened {}", path);
  return std::make_unique<StreamLineSource>(std::move(file), path);
}

std::unique_ptr<LineSource> FromString(std::string text) {
  return std::make_unique<StreamLineSource>(
      std::make_unique<std::istringstream>(std::move(text)), "<string>");
}

std::string SmapsPath(pid_t pid) {
  return "/proc/" + std::to_string(pid) + "/smaps";
}

std::string MapsPath(pid_t pid) {
  return "/proc/" + std::to_string(pid) + "/maps";
}

} // namespace procmaps
