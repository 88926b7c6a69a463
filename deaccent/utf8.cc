#include "deaccent/utf8.hh"

#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <stdint.h>

using U_ICU_NAMESPACE::UnicodeString;

namespace deaccent {

NotUTF8Exception::NotUTF8Exception() throw() {}
NotUTF8Exception::~NotUTF8Exception() throw() {}

StringTooLongException::StringTooLongException() throw() {}
StringTooLongException::~StringTooLongException() throw() {}

namespace {

const std::size_t kInt32Max = 2147483647ULL;

void CheckLength(const util::StringPiece &str) {
  UTIL_THROW_IF(str.size() > kInt32Max, StringTooLongException, "ICU uses int32_t for string sizes but this string has " << str.size() << " bytes.");
}

// Returns the byte offset of the first malformed sequence or -1 if there is none.
int32_t FindInvalid(const util::StringPiece &text, std::size_t &codepoints) {
  CheckLength(text);
  const uint8_t *data = reinterpret_cast<const uint8_t*>(text.data());
  int32_t length = static_cast<int32_t>(text.size());
  int32_t offset = 0;
  codepoints = 0;
  while (offset < length) {
    int32_t start = offset;
    UChar32 character;
    U8_NEXT(data, offset, length, character);
    if (character < 0) return start;
    ++codepoints;
  }
  return -1;
}

} // namespace

bool IsUTF8(const util::StringPiece &text) {
  std::size_t ignored;
  return FindInvalid(text, ignored) == -1;
}

std::size_t CountCodepoints(const util::StringPiece &text) {
  std::size_t codepoints;
  int32_t bad = FindInvalid(text, codepoints);
  UTIL_THROW_IF(bad != -1, NotUTF8Exception, "Bad UTF-8 at byte " << bad << " after " << codepoints << " code points");
  return codepoints;
}

void ToUnicode(const util::StringPiece &in, UnicodeString &out) {
  CheckLength(in);
  U_ICU_NAMESPACE::StringPiece icupiece(in.data(), static_cast<int32_t>(in.size()));
  out = UnicodeString::fromUTF8(icupiece);
  UTIL_THROW_IF(out.isBogus(), NotUTF8Exception, "ICU could not build a string from " << in.size() << " bytes");
}

void FromUnicode(const UnicodeString &in, std::string &out) {
  out.clear();
  in.toUTF8String(out);
}

} // namespace deaccent
