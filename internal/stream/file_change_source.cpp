#include "file_change_source.hpp"

#include <fstream>

#include "internal/util/errors.hpp"

namespace rowcast::stream {

namespace {

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

FileChangeSource::FileChangeSource(std::string path) : path_(std::move(path)) {
}

std::vector<PendingChange> FileChangeSource::Peek(util::Lsn from, std::size_t max) {
  std::ifstream in(path_);
  if (!in) {
    throw util::Unavailable("cannot open change file " + path_);
  }

  std::vector<PendingChange> out;
  std::string                line;
  util::Lsn                  line_no = 0;
  while (out.size() < max && std::getline(in, line)) {
    ++line_no;
    if (line_no <= from || IsBlank(line)) continue;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    out.push_back({line_no, std::move(line)});
  }
  return out;
}

void FileChangeSource::Advance(util::Lsn) {
}

std::string FileChangeSource::Name() const {
  return "file:" + path_;
}

} // namespace rowcast::stream
