#pragma once

#include <stdexcept>
#include <string>

namespace snapshot::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Track does not resolve in the sandbox tree (index out of range or removed).
class TrackNotFound : public std::runtime_error {
 public:
  explicit TrackNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lock / unlock state mismatch, or mutation of a locked snapshot.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Project or sandbox is not in a state that admits the request.
class NotAvailable : public std::runtime_error {
 public:
  explicit NotAvailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Expected METS file group is absent.
class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedDocument : public std::runtime_error {
 public:
  explicit MalformedDocument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BadRequest : public std::runtime_error {
 public:
  explicit BadRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace snapshot::util
