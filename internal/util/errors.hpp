#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace heritage::util {

/*
  Central error types.

  These get translated to process exit codes by the command line layer.
*/

/*
  Base for errors tied to one line of the input dataset.
*/
class DatasetError : public std::runtime_error {
 public:
  DatasetError(std::size_t line, const std::string& msg)
      : std::runtime_error("line " + std::to_string(line) + ": " + msg), line_(line) {
  }

  std::size_t line() const noexcept {
    return line_;
  }

 private:
  std::size_t line_;
};

class MalformedRecord : public DatasetError {
 public:
  MalformedRecord(std::size_t line, const std::string& msg) : DatasetError(line, "malformed record: " + msg) {
  }
};

class MissingField : public DatasetError {
 public:
  MissingField(std::size_t line, const std::string& column)
      : DatasetError(line, "missing required field '" + column + "'"), column_(column) {
  }

  const std::string& column() const noexcept {
    return column_;
  }

 private:
  std::string column_;
};

class InvalidMetadata : public DatasetError {
 public:
  InvalidMetadata(std::size_t line, const std::string& column, const std::string& value)
      : DatasetError(line, "invalid value '" + value + "' for '" + column + "', expected a non-negative integer"),
        column_(column) {
  }

  const std::string& column() const noexcept {
    return column_;
  }

 private:
  std::string column_;
};

class ConflictingPersonData : public DatasetError {
 public:
  ConflictingPersonData(std::size_t line, const std::string& id, const std::string& msg)
      : DatasetError(line, "conflicting data for person " + id + ": " + msg), id_(id) {
  }

  const std::string& id() const noexcept {
    return id_;
  }

 private:
  std::string id_;
};

class DatasetIoError : public std::runtime_error {
 public:
  explicit DatasetIoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownIdentifier : public std::runtime_error {
 public:
  UnknownIdentifier(const std::string& id, const std::string& role)
      : std::runtime_error("unknown " + role + " identifier: " + id), id_(id), role_(role) {
  }

  const std::string& id() const noexcept {
    return id_;
  }

  const std::string& role() const noexcept {
    return role_;
  }

 private:
  std::string id_;
  std::string role_;
};

class NoPathFound : public std::runtime_error {
 public:
  NoPathFound(const std::string& from, const std::string& to)
      : std::runtime_error("no path from " + from + " to " + to), from_(from), to_(to) {
  }

  const std::string& from() const noexcept {
    return from_;
  }

  const std::string& to() const noexcept {
    return to_;
  }

 private:
  std::string from_;
  std::string to_;
};

} // namespace heritage::util
