/***
 * Name: pyinfer::exceptions::FileReadError
 * Purpose: Exception for filesystem read/write failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException.
 */
#pragma once

#include "pyinfer/exceptions/pyinfer_exception.h"

#include <string>
#include <utility>

namespace pyinfer {
namespace exceptions {

class FileReadError : public PyinferException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
