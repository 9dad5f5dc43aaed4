/***
 * Name: pyinfer::exceptions::ParseError
 * Purpose: Exception for lexing and parsing failures.
 * Inputs: Error message and the 1-based position of the offending token
 * Outputs: Exception object
 * Theory of Operation: Carries the position separately so callers can build
 *   a SyntaxFailure without re-parsing the message.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"

#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class ParseError : public PyinferException {
 public:
  ParseError(std::string msg, const int line, const int col) noexcept
      : PyinferException(std::move(msg)), line_(line), col_(col) {}

  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace pyinfer
