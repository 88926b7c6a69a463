/* Moving text between UTF-8 and ICU's UTF-16 strings. */

#ifndef DEACCENT_UTF8
#define DEACCENT_UTF8

#include "util/exception.hh"
#include "util/string_piece.hh"

#include <cstddef>
#include <string>

#include <unicode/utypes.h>

U_NAMESPACE_BEGIN
class UnicodeString;
U_NAMESPACE_END

namespace deaccent {

// This is what happens when you pass bad UTF8.
class NotUTF8Exception : public util::Exception {
  public:
    NotUTF8Exception() throw();
    ~NotUTF8Exception() throw();
};

// ICU uses int32_t for string sizes.
class StringTooLongException : public util::Exception {
  public:
    StringTooLongException() throw();
    ~StringTooLongException() throw();
};

// Strict check: no surrogates, overlongs, or code points past U+10FFFF.
// Throws StringTooLongException for text ICU can't index.
bool IsUTF8(const util::StringPiece &text);

// Throws NotUTF8Exception on malformed input.
std::size_t CountCodepoints(const util::StringPiece &text);

// Malformed sequences become U+FFFD, as ICU does.  Use IsUTF8 first if that matters.
void ToUnicode(const util::StringPiece &in, U_ICU_NAMESPACE::UnicodeString &out);

// Replaces the contents of out.
void FromUnicode(const U_ICU_NAMESPACE::UnicodeString &in, std::string &out);

} // namespace deaccent

#endif // DEACCENT_UTF8
