#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flowstore::util {

/*
  Central error types.

  Every public store operation reports failure by throwing one of these.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised while reading a JSON or properties blob that is not well formed.
class InvalidFormat : public std::runtime_error {
 public:
  explicit InvalidFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }

  PersistenceError(const std::string& msg, const std::exception& cause) : std::runtime_error(msg + ": " + cause.what()) {
  }
};

/*
  An upload whose flows carried structural errors and was not forced.
  what() is every message joined by '\n'.
*/
class UploadRejected : public std::runtime_error {
 public:
  explicit UploadRejected(std::vector<std::string> errors) : std::runtime_error(Join(errors)), errors_(std::move(errors)) {
  }

  const std::vector<std::string>& Errors() const {
    return errors_;
  }

 private:
  static std::string Join(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& error : errors) {
      joined += error;
      joined += '\n';
    }
    return joined;
  }

  std::vector<std::string> errors_;
};

} // namespace flowstore::util
