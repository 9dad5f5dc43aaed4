/***
 * Name: pyinfer::support (unicode)
 * Purpose: ICU-backed helpers for identifiers and case-insensitive matching.
 * Inputs: UTF-8 strings and code points
 * Outputs: Classification results and normalized UTF-8 strings
 * Theory of Operation:
 *   Identifier classification follows XID_Start/XID_Continue. Normalization
 *   is NFKC as the source language applies it to identifiers. Conversions
 *   go UTF-8 -> UTF-16 -> ICU -> UTF-8; on any ICU failure the input is
 *   returned unchanged.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pyinfer {
namespace support {

bool IsIdentifierStart(int32_t codePoint);
bool IsIdentifierContinue(int32_t codePoint);

/*** DecodeUtf8: read one code point at index (advanced past it); -1 when malformed. */
int32_t DecodeUtf8(const std::string& text, std::size_t& index);

/*** NormalizeIdentifier: NFKC normalization; ASCII input is returned as-is. */
std::string NormalizeIdentifier(const std::string& utf8);

/*** FoldCase: full Unicode case folding (ASCII fast path). */
std::string FoldCase(const std::string& utf8);
/*** StartsUppercase: first code point has the Uppercase property. */
bool StartsUppercase(const std::string& utf8);

}  // namespace support
}  // namespace pyinfer
