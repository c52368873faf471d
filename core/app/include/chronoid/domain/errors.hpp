#pragma once

#include <stdexcept>
#include <string>

namespace chronoid {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions thrown by generation and parsing. Every failure is local
//         to the single call that raised it; no partial identifier is ever
//         returned and no monotonic state is mutated by a failed call.
//
// All types derive from IdentifierError so callers that do not care about
// the specific condition can catch one type.
// -----------------------------------------------------------------------------
class IdentifierError : public std::runtime_error {
 public:
  explicit IdentifierError(const std::string& what)
      : std::runtime_error(what) {}
};

// Timestamp is negative (other than the -1 max sentinel) or its millisecond
// part does not fit the 48-bit unix_ts_ms field.
class InvalidTimestamp : public IdentifierError {
 public:
  explicit InvalidTimestamp(const std::string& what) : IdentifierError(what) {}
};

// Parse input has the wrong length, a character outside the expected set,
// or a compact string whose value overflows 128 bits.
class MalformedIdentifier : public IdentifierError {
 public:
  explicit MalformedIdentifier(const std::string& what)
      : IdentifierError(what) {}
};

// Strict-mode extraction on an identifier whose ver field is not 7.
class NotVersion7 : public IdentifierError {
 public:
  NotVersion7(const std::string& what, unsigned version)
      : IdentifierError(what), version_(version) {}

  unsigned version() const { return version_; }

 private:
  unsigned version_;
};

// The randomness provider could not deliver the requested bytes.
class EntropyError : public IdentifierError {
 public:
  explicit EntropyError(const std::string& what) : IdentifierError(what) {}
};

}  // namespace chronoid
