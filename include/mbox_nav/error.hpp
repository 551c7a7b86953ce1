#pragma once
#include <string>
#include <utility>

namespace mn {

// Failure kinds surfaced to callers. Decoding and year classification
// never produce one of these.
enum class ErrorKind { None, NotFound, OutOfRange, Io, Usage, Interrupted };

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  explicit operator bool() const noexcept { return kind != ErrorKind::None; }
  void clear() { kind = ErrorKind::None; message.clear(); }
};

inline void set_error(Error* err, ErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

inline const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::None:        return "none";
    case ErrorKind::NotFound:    return "not found";
    case ErrorKind::OutOfRange:  return "out of range";
    case ErrorKind::Io:          return "i/o error";
    case ErrorKind::Usage:       return "usage";
    case ErrorKind::Interrupted: return "interrupted";
  }
  return "unknown";
}

}
