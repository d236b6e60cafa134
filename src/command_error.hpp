#pragma once
/*
 * CommandError
 *
 * Purpose: error taxonomy raised by registration and dispatch.
 * Note: errors thrown by a command's own effect are not wrapped in this type.
 */
#include <stdexcept>
#include <string>

enum class ErrorKind {
  InvalidCommand,
  CommandNotFound,
  CommandUnavailable,
  MissingParameters,
  InvalidParameterType
};

const char* error_kind_name(ErrorKind kind);

class CommandError : public std::runtime_error {
public:
  CommandError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }
private:
  ErrorKind kind_;
};
