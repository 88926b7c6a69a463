#include "deaccent/normalizer.hh"
#include "deaccent/utf8.hh"

#include <unicode/normalizer2.h>
#include <unicode/putil.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

using U_ICU_NAMESPACE::Normalizer2;
using U_ICU_NAMESPACE::UnicodeString;

namespace deaccent {

UnicodeUnavailableException::UnicodeUnavailableException() throw() {}
UnicodeUnavailableException::~UnicodeUnavailableException() throw() {}

NormalizeException::NormalizeException() throw() {}
NormalizeException::~NormalizeException() throw() {}

Normalizer::~Normalizer() {}

namespace {

const Normalizer2 *LoadInstance(const Normalizer2 *(*getter)(UErrorCode &), const char *name) {
  UErrorCode err = U_ZERO_ERROR;
  const Normalizer2 *ret = getter(err);
  UTIL_THROW_IF(U_FAILURE(err) || !ret, UnicodeUnavailableException,
      "Could not load ICU " << name << " data: " << u_errorName(err) <<
      ".  Install the ICU data library (libicudata) or point --icu-data or the ICU_DATA environment variable at the directory holding it.");
  return ret;
}

void Run(const Normalizer2 &normalizer, const char *name, const UnicodeString &in, UnicodeString &out) {
  UErrorCode err = U_ZERO_ERROR;
  normalizer.normalize(in, out, err);
  if (U_FAILURE(err)) {
    std::string failed;
    FromUnicode(in, failed);
    UTIL_THROW(NormalizeException, name << " of '" << failed << "' failed: " << u_errorName(err));
  }
}

} // namespace

ICUNormalizer::ICUNormalizer()
  : nfd_(LoadInstance(&Normalizer2::getNFDInstance, "NFD")),
    nfc_(LoadInstance(&Normalizer2::getNFCInstance, "NFC")) {}

void ICUNormalizer::Decompose(const UnicodeString &in, UnicodeString &out) const {
  Run(*nfd_, "NFD", in, out);
}

bool ICUNormalizer::IsNonspacingMark(UChar32 character) const {
  return u_charType(character) == U_NON_SPACING_MARK;
}

void ICUNormalizer::Compose(const UnicodeString &in, UnicodeString &out) const {
  Run(*nfc_, "NFC", in, out);
}

void SetDataDirectory(const std::string &path) {
  u_setDataDirectory(path.c_str());
}

} // namespace deaccent
