#include "deaccent/strip.hh"
#include "deaccent/utf8.hh"

#include <unicode/translit.h>
#include <unicode/unistr.h>

using U_ICU_NAMESPACE::Transliterator;
using U_ICU_NAMESPACE::UnicodeString;

namespace deaccent {

UnknownEngineException::UnknownEngineException() throw() {}
UnknownEngineException::~UnknownEngineException() throw() {}

Stripper::~Stripper() {}

void Stripper::Apply(const util::StringPiece &in, std::string &out) const {
  UnicodeString from, to;
  ToUnicode(in, from);
  Apply(from, to);
  FromUnicode(to, out);
}

void NormalizerStripper::Apply(const UnicodeString &in, UnicodeString &out) const {
  UnicodeString decomposed;
  normalizer_.Decompose(in, decomposed);
  UnicodeString filtered;
  for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
    UChar32 character = decomposed.char32At(i);
    if (!normalizer_.IsNonspacingMark(character)) filtered.append(character);
  }
  normalizer_.Compose(filtered, out);
}

namespace {
const char kTransform[] = "Any-NFD; [:Nonspacing Mark:] Remove; Any-NFC";
} // namespace

TransliteratorStripper::TransliteratorStripper() {
  UErrorCode err = U_ZERO_ERROR;
  prototype_.reset(Transliterator::createInstance(UnicodeString::fromUTF8(kTransform), UTRANS_FORWARD, err));
  UTIL_THROW_IF(U_FAILURE(err) || !prototype_, UnicodeUnavailableException,
      "Could not create ICU transform \"" << kTransform << "\": " << u_errorName(err) <<
      ".  Install the ICU data library (libicudata) or point --icu-data or the ICU_DATA environment variable at the directory holding it.");
}

TransliteratorStripper::~TransliteratorStripper() {}

void TransliteratorStripper::Apply(const UnicodeString &in, UnicodeString &out) const {
  std::unique_ptr<Transliterator> local(prototype_->clone());
  UTIL_THROW_IF(!local, NormalizeException, "Cloning the ICU transform failed");
  out = in;
  local->transliterate(out);
}

namespace {

// Keeps the normalizer alive as long as the stripper using it.
class OwningNormalizerStripper : public Stripper {
  public:
    OwningNormalizerStripper() : stripper_(normalizer_) {}

    using Stripper::Apply;
    void Apply(const UnicodeString &in, UnicodeString &out) const {
      stripper_.Apply(in, out);
    }

  private:
    ICUNormalizer normalizer_;
    NormalizerStripper stripper_;
};

} // namespace

Engine ParseEngine(const util::StringPiece &name) {
  if (name == "normalizer") return Engine::kNormalizer;
  if (name == "transliterator") return Engine::kTransliterator;
  UTIL_THROW(UnknownEngineException, "Unknown engine " << name << ".  Use normalizer or transliterator.");
}

const char *EngineName(Engine engine) {
  switch (engine) {
    case Engine::kNormalizer:
      return "normalizer";
    case Engine::kTransliterator:
      return "transliterator";
  }
  return "unknown";
}

std::unique_ptr<Stripper> MakeStripper(Engine engine) {
  switch (engine) {
    case Engine::kNormalizer:
      return std::unique_ptr<Stripper>(new OwningNormalizerStripper());
    case Engine::kTransliterator:
      return std::unique_ptr<Stripper>(new TransliteratorStripper());
  }
  UTIL_THROW(UnknownEngineException, "Unknown engine number " << static_cast<int>(engine));
}

} // namespace deaccent
