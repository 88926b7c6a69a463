/* The Unicode engine the stripper is built on. */

#ifndef DEACCENT_NORMALIZER
#define DEACCENT_NORMALIZER

#include "util/exception.hh"

#include <string>

#include <unicode/utypes.h>

U_NAMESPACE_BEGIN
class Normalizer2;
class UnicodeString;
U_NAMESPACE_END

namespace deaccent {

// ICU is missing its data or could not be set up.  Every later call would
// fail the same way, so this is thrown once, when an engine is constructed.
class UnicodeUnavailableException : public util::Exception {
  public:
    UnicodeUnavailableException() throw();
    ~UnicodeUnavailableException() throw();
};

// ICU returned an error for a particular string.
class NormalizeException : public util::Exception {
  public:
    NormalizeException() throw();
    ~NormalizeException() throw();
};

// Implementations must be safe to call from several threads at once.
class Normalizer {
  public:
    virtual ~Normalizer();

    // Canonical decomposition (NFD).  in and out must be different objects.
    virtual void Decompose(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const = 0;

    // General category Mn.
    virtual bool IsNonspacingMark(UChar32 character) const = 0;

    // Canonical composition (NFC).  in and out must be different objects.
    virtual void Compose(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const = 0;
};

class ICUNormalizer : public Normalizer {
  public:
    // Throws UnicodeUnavailableException if ICU can't load normalization data.
    ICUNormalizer();

    void Decompose(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const;

    bool IsNonspacingMark(UChar32 character) const;

    void Compose(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const;

  private:
    // Owned by ICU.
    const U_ICU_NAMESPACE::Normalizer2 *nfd_, *nfc_;
};

// Where ICU looks for its .dat file.  Call before constructing any engine.
void SetDataDirectory(const std::string &path);

} // namespace deaccent

#endif // DEACCENT_NORMALIZER
