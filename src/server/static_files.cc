#include "server/static_files.h"

#include <sys/stat.h>

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

const char *const StaticFiles::index_document = "/index.html";

namespace {

bool EndsWith(const std::string &s, const char *suffix) {
  const std::string tail(suffix);
  return s.size() >= tail.size() &&
         s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

}  // namespace

StaticFiles::StaticFiles(std::string root) : root_(std::move(root)) {
  while (root_.size() > 1 && root_.back() == '/') {
    root_.pop_back();
  }
}

boost::optional<std::string> StaticFiles::Resolve(
    const std::string &resource) const {
  std::string path = resource.substr(0, resource.find_first_of("?#"));
  if (path.empty() || path == "/") {
    path = index_document;
  }
  if (path[0] != '/' || path.find('\\') != std::string::npos ||
      path.find('\0') != std::string::npos) {
    return boost::none;
  }

  std::vector<std::string> segments;
  std::stringstream in(path.substr(1));
  std::string seg;
  while (std::getline(in, seg, '/')) {
    if (seg.empty() || seg == ".") {
      continue;
    }
    if (seg == "..") {
      if (segments.empty()) {
        return boost::none;
      }
      segments.pop_back();
      continue;
    }
    segments.push_back(seg);
  }

  if (segments.empty()) {
    return boost::none;
  }

  std::string out = root_;
  for (const std::string &s : segments) {
    out += '/';
    out += s;
  }
  return out;
}

std::string StaticFiles::ContentTypeFor(const std::string &path) {
  if (EndsWith(path, ".html")) return "text/html; charset=utf-8";
  if (EndsWith(path, ".js")) return "text/javascript; charset=utf-8";
  if (EndsWith(path, ".css")) return "text/css; charset=utf-8";
  if (EndsWith(path, ".json")) return "application/json";
  if (EndsWith(path, ".png")) return "image/png";
  if (EndsWith(path, ".svg")) return "image/svg+xml";
  if (EndsWith(path, ".ico")) return "image/x-icon";
  return "application/octet-stream";
}

StaticFiles::Response StaticFiles::Serve(const std::string &resource) const {
  const boost::optional<std::string> path = Resolve(resource);
  if (!path) {
    return Response{403, "text/plain", "Forbidden"};
  }

  struct stat st;
  if (stat(path->c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return Response{404, "text/plain", "Not found"};
  }

  std::ifstream file(*path, std::ios::in | std::ios::binary);
  if (!file) {
    return Response{404, "text/plain", "Not found"};
  }

  std::stringstream body;
  if (st.st_size > 0) {
    body << file.rdbuf();
  }
  if (file.bad()) {
    return Response{404, "text/plain", "Not found"};
  }
  return Response{200, ContentTypeFor(*path), body.str()};
}
