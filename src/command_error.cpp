#include "command_error.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidCommand: return "InvalidCommand";
    case ErrorKind::CommandNotFound: return "CommandNotFound";
    case ErrorKind::CommandUnavailable: return "CommandUnavailable";
    case ErrorKind::MissingParameters: return "MissingParameters";
    case ErrorKind::InvalidParameterType: return "InvalidParameterType";
  }
  return "Unknown";
}
