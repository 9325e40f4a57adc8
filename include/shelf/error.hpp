#pragma once

#include <stdexcept>
#include <string>

namespace shelf {

enum class ErrorKind {
  NotFound,
  Duplicate,
  InUse,
  Range,
  AlreadyMember,
  NotMember,
  InvalidFormat,
  IO,
  BadInput
};

// What the caller should do with the rest of the input line it was reading
enum class Recovery {
  DiscardLine,
  KeepLine
};

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message, Recovery recovery)
    : std::runtime_error(message), m_kind(kind), m_recovery(recovery) {}

  ErrorKind kind() const noexcept { return m_kind; }
  Recovery recovery() const noexcept { return m_recovery; }
  bool discards_line() const noexcept { return m_recovery == Recovery::DiscardLine; }

private:
  ErrorKind m_kind;
  Recovery m_recovery;
};

inline constexpr const char* kInvalidFile = "Invalid data found in file!";

[[noreturn]] inline void throw_invalid_file() {
  throw Error(ErrorKind::InvalidFormat, kInvalidFile, Recovery::DiscardLine);
}

} // namespace shelf
