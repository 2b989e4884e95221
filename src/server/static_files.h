#ifndef SRC_SERVER_STATIC_FILES_H_
#define SRC_SERVER_STATIC_FILES_H_

#include <string>

#include <boost/optional.hpp>

// Plain HTTP requests on the game port serve the browser client from a fixed
// asset root.
class StaticFiles {
 public:
  explicit StaticFiles(std::string root);

  struct Response {
    int status;
    std::string content_type;
    std::string body;
  };

  Response Serve(const std::string &resource) const;

  // Path under root for a request target, empty when the target would
  // escape the root. "/" maps to the entry document.
  boost::optional<std::string> Resolve(const std::string &resource) const;

  static std::string ContentTypeFor(const std::string &path);

  const std::string &root() const { return root_; }

  static const char *const index_document;

 private:
  std::string root_;
};

#endif  // SRC_SERVER_STATIC_FILES_H_
