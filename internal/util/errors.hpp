#pragma once

#include <stdexcept>
#include <string>

namespace valuegraph::util {

/*
  Central error types.

  Thrown by the store facade; the repository layer reports db::Result codes
  and the facade translates them into these.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateIdentifier : public std::runtime_error {
 public:
  explicit DuplicateIdentifier(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedIdentifier : public std::runtime_error {
 public:
  explicit MalformedIdentifier(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A migration step could not complete. The recorded generation was not advanced.
class MigrationFailed : public std::runtime_error {
 public:
  explicit MigrationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace valuegraph::util
