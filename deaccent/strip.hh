/* Remove diacritics: decompose, drop nonspacing marks, recompose.
 * Greek tonos, breathings and ypogegrammeni all decompose to nonspacing marks.
 * So do accents in every other script: "café" becomes "cafe".
 */

#ifndef DEACCENT_STRIP
#define DEACCENT_STRIP

#include "deaccent/normalizer.hh"
#include "util/exception.hh"
#include "util/string_piece.hh"

#include <memory>
#include <string>

#include <unicode/utypes.h>

U_NAMESPACE_BEGIN
class Transliterator;
class UnicodeString;
U_NAMESPACE_END

namespace deaccent {

class UnknownEngineException : public util::Exception {
  public:
    UnknownEngineException() throw();
    ~UnknownEngineException() throw();
};

// Immutable once built, so one instance can serve any number of threads.
class Stripper {
  public:
    virtual ~Stripper();

    // in and out must be different objects.
    virtual void Apply(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const = 0;

    // UTF-8 in and out.
    void Apply(const util::StringPiece &in, std::string &out) const;
};

// Does the work with a Normalizer owned by the caller.
class NormalizerStripper : public Stripper {
  public:
    explicit NormalizerStripper(const Normalizer &normalizer) : normalizer_(normalizer) {}

    using Stripper::Apply;
    void Apply(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const;

  private:
    const Normalizer &normalizer_;
};

// One ICU transform: Any-NFD; [:Nonspacing Mark:] Remove; Any-NFC
class TransliteratorStripper : public Stripper {
  public:
    // Throws UnicodeUnavailableException if ICU can't build the transform.
    TransliteratorStripper();
    ~TransliteratorStripper();

    using Stripper::Apply;
    void Apply(const U_ICU_NAMESPACE::UnicodeString &in, U_ICU_NAMESPACE::UnicodeString &out) const;

  private:
    // Transliterators keep state while running so each call works on a clone.
    std::unique_ptr<U_ICU_NAMESPACE::Transliterator> prototype_;
};

enum class Engine { kNormalizer, kTransliterator };

// "normalizer" or "transliterator".
Engine ParseEngine(const util::StringPiece &name);

const char *EngineName(Engine engine);

// Throws UnicodeUnavailableException if ICU is not usable.
std::unique_ptr<Stripper> MakeStripper(Engine engine = Engine::kNormalizer);

inline std::string Strip(const Stripper &stripper, const util::StringPiece &text) {
  std::string ret;
  stripper.Apply(text, ret);
  return ret;
}

} // namespace deaccent

#endif // DEACCENT_STRIP
