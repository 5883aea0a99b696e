#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace recon::util {

/*
  Central error types.

  Per-record errors (MissingFieldError, IncompleteBookingError,
  AmbiguousLinkConflict) are collected into the run report.
  ApplyAbortError is fatal to the batch.
*/

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingFieldError : public std::runtime_error {
 public:
  MissingFieldError(std::string field, const std::string& msg) : std::runtime_error(msg), field_(std::move(field)) {
  }

  const std::string& Field() const {
    return field_;
  }

 private:
  std::string field_;
};

// A transaction already holds an active link to a different counterpart.
class AmbiguousLinkConflict : public std::runtime_error {
 public:
  AmbiguousLinkConflict(std::string transaction_id, std::string existing_link_id, const std::string& msg)
      : std::runtime_error(msg), transaction_id_(std::move(transaction_id)), existing_link_id_(std::move(existing_link_id)) {
  }

  const std::string& TransactionId() const {
    return transaction_id_;
  }
  const std::string& ExistingLinkId() const {
    return existing_link_id_;
  }

 private:
  std::string transaction_id_;
  std::string existing_link_id_;
};

class IncompleteBookingError : public std::runtime_error {
 public:
  IncompleteBookingError(std::string booking_id, const std::string& msg) : std::runtime_error(msg), booking_id_(std::move(booking_id)) {
  }

  const std::string& BookingId() const {
    return booking_id_;
  }

 private:
  std::string booking_id_;
};

class ApplyAbortError : public std::runtime_error {
 public:
  explicit ApplyAbortError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace recon::util
