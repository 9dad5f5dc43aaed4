/***
 * Name: pyinfer::exceptions::PyinferException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pyinfer/exceptions/pyinfer_exception.h"

namespace pyinfer::exceptions {

const char* PyinferException::what() const noexcept { return message_.c_str(); }

}  // namespace pyinfer::exceptions
