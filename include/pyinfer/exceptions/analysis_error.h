/***
 * Name: pyinfer::exceptions::AnalysisError
 * Purpose: Exception for unexpected faults during tree or table traversal.
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

class AnalysisError : public PyinferException {
 public:
  explicit AnalysisError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
