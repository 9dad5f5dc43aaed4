/***
 * Name: pyinfer::support (unicode impl)
 * Purpose: Identifier classification, NFKC normalization and case folding via ICU.
 */
#include "pyinfer/support/unicode.h"

#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>

#include <cstdint>
#include <string>
#include <vector>

namespace pyinfer {
namespace support {

namespace {
bool isAscii(const std::string& s) {
  for (const char c : s) {
    if (static_cast<unsigned char>(c) >= 0x80U) { return false; }
  }
  return true;
}

bool toUtf16(const std::string& utf8, std::vector<UChar>& out) {
  UErrorCode status = U_ZERO_ERROR;
  int32_t uLen = 0;
  u_strFromUTF8(nullptr, 0, &uLen, utf8.data(), static_cast<int32_t>(utf8.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR;
  out.assign(static_cast<std::size_t>(uLen) + 1, 0);
  u_strFromUTF8(out.data(), uLen + 1, nullptr, utf8.data(), static_cast<int32_t>(utf8.size()), &status);
  if (U_FAILURE(status)) { return false; }
  out.resize(static_cast<std::size_t>(uLen));
  return true;
}

bool toUtf8(const std::vector<UChar>& utf16, std::string& out) {
  UErrorCode status = U_ZERO_ERROR;
  int32_t outLen = 0;
  u_strToUTF8(nullptr, 0, &outLen, utf16.data(), static_cast<int32_t>(utf16.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return false; }
  status = U_ZERO_ERROR;
  std::vector<char> buf(static_cast<std::size_t>(outLen) + 1);
  u_strToUTF8(buf.data(), outLen + 1, nullptr, utf16.data(), static_cast<int32_t>(utf16.size()), &status);
  if (U_FAILURE(status)) { return false; }
  out.assign(buf.data(), static_cast<std::size_t>(outLen));
  return true;
}
} // namespace

bool IsIdentifierStart(const int32_t codePoint) {
  if (codePoint == '_') { return true; }
  return u_hasBinaryProperty(codePoint, UCHAR_XID_START) != 0;
}

bool IsIdentifierContinue(const int32_t codePoint) {
  if (codePoint == '_') { return true; }
  return u_hasBinaryProperty(codePoint, UCHAR_XID_CONTINUE) != 0;
}

int32_t DecodeUtf8(const std::string& text, std::size_t& index) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data()); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
  auto pos = static_cast<int32_t>(index);
  UChar32 codePoint = 0;
  U8_NEXT(bytes, pos, static_cast<int32_t>(text.size()), codePoint);
  index = static_cast<std::size_t>(pos);
  return codePoint < 0 ? -1 : codePoint;
}

std::string NormalizeIdentifier(const std::string& utf8) {
  if (isAscii(utf8)) { return utf8; }
  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* norm = unorm2_getNFKCInstance(&status);
  if (U_FAILURE(status)) { return utf8; }
  std::vector<UChar> src;
  if (!toUtf16(utf8, src)) { return utf8; }
  const int32_t nLen = unorm2_normalize(norm, src.data(), static_cast<int32_t>(src.size()), nullptr, 0, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return utf8; }
  status = U_ZERO_ERROR;
  std::vector<UChar> normBuf(static_cast<std::size_t>(nLen) + 1);
  unorm2_normalize(norm, src.data(), static_cast<int32_t>(src.size()), normBuf.data(), nLen + 1, &status);
  if (U_FAILURE(status)) { return utf8; }
  normBuf.resize(static_cast<std::size_t>(nLen));
  std::string out;
  if (!toUtf8(normBuf, out)) { return utf8; }
  return out;
}

std::string FoldCase(const std::string& utf8) {
  if (isAscii(utf8)) {
    std::string out = utf8;
    for (auto& c : out) { if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); } }
    return out;
  }
  std::vector<UChar> src;
  if (!toUtf16(utf8, src)) { return utf8; }
  UErrorCode status = U_ZERO_ERROR;
  const int32_t fLen = u_strFoldCase(nullptr, 0, src.data(), static_cast<int32_t>(src.size()), U_FOLD_CASE_DEFAULT, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) { return utf8; }
  status = U_ZERO_ERROR;
  std::vector<UChar> fbuf(static_cast<std::size_t>(fLen) + 1);
  u_strFoldCase(fbuf.data(), fLen + 1, src.data(), static_cast<int32_t>(src.size()), U_FOLD_CASE_DEFAULT, &status);
  if (U_FAILURE(status)) { return utf8; }
  fbuf.resize(static_cast<std::size_t>(fLen));
  std::string out;
  if (!toUtf8(fbuf, out)) { return utf8; }
  return out;
}

bool StartsUppercase(const std::string& utf8) {
  if (utf8.empty()) { return false; }
  std::size_t index = 0;
  const int32_t first = DecodeUtf8(utf8, index);
  if (first < 0) { return false; }
  return u_isUUppercase(first) != 0;
}

}  // namespace support
}  // namespace pyinfer
