#include "deaccent/strip.hh"
#include "deaccent/normalizer.hh"
#include "deaccent/utf8.hh"

#define BOOST_TEST_MODULE StripTest
#include <boost/test/unit_test.hpp>

#include <unicode/unistr.h>

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using U_ICU_NAMESPACE::UnicodeString;

namespace deaccent {
namespace {

const char kSentence[] = "Ἄνθρωπος ἔφυγε ἀπὸ τὸ σπίτι του. Ἡ Ἱστορία. ῥόδον Ῥήτορος. Ἀθῆναι.";
const char kSentenceStripped[] = "Ανθρωπος εφυγε απο το σπιτι του. Η Ιστορια. ροδον Ρητορος. Αθηναι.";

// Both engines have to agree on everything.
#define CHECK_STRIP(ref, from) { \
  for (Engine engine : {Engine::kNormalizer, Engine::kTransliterator}) { \
    std::unique_ptr<Stripper> stripper(MakeStripper(engine)); \
    BOOST_CHECK_EQUAL(ref, Strip(*stripper, from)); \
  } \
}

BOOST_AUTO_TEST_CASE(Sentence) {
  CHECK_STRIP(kSentenceStripped, kSentence);
}

BOOST_AUTO_TEST_CASE(BreathingsAndSubscripts) {
  CHECK_STRIP("Ελλας, ωδη, αδω", "Ἑλλάς, ᾠδὴ, ᾄδω");
  CHECK_STRIP("α", "ᾳ");
  CHECK_STRIP("ΑΙ", "ᾼΙ");
}

BOOST_AUTO_TEST_CASE(Empty) {
  CHECK_STRIP("", "");
}

BOOST_AUTO_TEST_CASE(Unmarked) {
  CHECK_STRIP("hello", "hello");
  CHECK_STRIP("Ανθρωπος", "Ανθρωπος");
  CHECK_STRIP("1 + 2 = 3 \t ;:", "1 + 2 = 3 \t ;:");
  // Spacing tonos is a symbol, not a mark.
  CHECK_STRIP("\xce\x84", "\xce\x84");
}

BOOST_AUTO_TEST_CASE(AlreadyDecomposed) {
  // alpha + psili + oxia + ypogegrammeni
  CHECK_STRIP("α", "\xce\xb1\xcc\x93\xcc\x81\xcd\x85");
  // Stray mark with no base.
  CHECK_STRIP("x", "\xcc\x81x");
}

BOOST_AUTO_TEST_CASE(OtherScripts) {
  CHECK_STRIP("cafe naive Ecole", "café naïve École");
  CHECK_STRIP("Malmo", "Malmö");
  // Letters that don't decompose keep their shape.
  CHECK_STRIP("ø æ ß", "ø æ ß");
}

BOOST_AUTO_TEST_CASE(Idempotent) {
  std::unique_ptr<Stripper> stripper(MakeStripper());
  const char *inputs[] = {kSentence, "Ἑλλάς, ᾠδὴ, ᾄδω", "café", "", "ᾳ"};
  for (const char *input : inputs) {
    std::string once = Strip(*stripper, input);
    BOOST_CHECK_EQUAL(once, Strip(*stripper, once));
  }
}

BOOST_AUTO_TEST_CASE(OnlyDeletes) {
  std::unique_ptr<Stripper> stripper(MakeStripper());
  ICUNormalizer normalizer;
  UnicodeString in, decomposed, out;
  ToUnicode(kSentence, in);
  normalizer.Decompose(in, decomposed);
  stripper->Apply(in, out);

  std::set<UChar32> allowed;
  for (int32_t i = 0; i < decomposed.length(); i = decomposed.moveIndex32(i, 1)) {
    allowed.insert(decomposed.char32At(i));
  }
  BOOST_CHECK(out.countChar32() <= decomposed.countChar32());
  for (int32_t i = 0; i < out.length(); i = out.moveIndex32(i, 1)) {
    UChar32 character = out.char32At(i);
    BOOST_CHECK_MESSAGE(allowed.count(character) == 1, "Unexpected code point " << character);
    BOOST_CHECK(!normalizer.IsNonspacingMark(character));
  }
}

// Only treats U+0301 as a mark.
class AcuteOnly : public Normalizer {
  public:
    void Decompose(const UnicodeString &in, UnicodeString &out) const {
      real_.Decompose(in, out);
    }
    bool IsNonspacingMark(UChar32 character) const {
      return character == 0x0301;
    }
    void Compose(const UnicodeString &in, UnicodeString &out) const {
      real_.Compose(in, out);
    }

  private:
    ICUNormalizer real_;
};

BOOST_AUTO_TEST_CASE(InjectedNormalizer) {
  AcuteOnly acute;
  NormalizerStripper stripper(acute);
  // Grave survives, acute does not.
  BOOST_CHECK_EQUAL("e ὰ α", Strip(stripper, "é ὰ ά"));
}

BOOST_AUTO_TEST_CASE(SharedNormalizer) {
  ICUNormalizer normalizer;
  NormalizerStripper first(normalizer), second(normalizer);
  BOOST_CHECK_EQUAL("αδω", Strip(first, "ᾄδω"));
  BOOST_CHECK_EQUAL("Ελλας", Strip(second, "Ἑλλάς"));
}

BOOST_AUTO_TEST_CASE(UTF8Overload) {
  std::unique_ptr<Stripper> stripper(MakeStripper(Engine::kTransliterator));
  std::string out("leftover");
  stripper->Apply(util::StringPiece("ῥόδον"), out);
  BOOST_CHECK_EQUAL("ροδον", out);
}

BOOST_AUTO_TEST_CASE(Threads) {
  for (Engine engine : {Engine::kNormalizer, Engine::kTransliterator}) {
    std::unique_ptr<Stripper> stripper(MakeStripper(engine));
    const std::size_t kThreads = 8;
    std::vector<std::string> results(kThreads);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kThreads; ++t) {
      threads.push_back(std::thread([&stripper, &results, t]() {
        for (unsigned int i = 0; i < 200; ++i) {
          results[t] = Strip(*stripper, kSentence);
        }
      }));
    }
    for (std::thread &thread : threads) thread.join();
    for (const std::string &result : results) {
      BOOST_CHECK_EQUAL(kSentenceStripped, result);
    }
  }
}

BOOST_AUTO_TEST_CASE(Engines) {
  BOOST_CHECK(Engine::kNormalizer == ParseEngine("normalizer"));
  BOOST_CHECK(Engine::kTransliterator == ParseEngine("transliterator"));
  BOOST_CHECK_EQUAL("transliterator", EngineName(ParseEngine("transliterator")));
  BOOST_CHECK_THROW(ParseEngine("icu"), UnknownEngineException);
  BOOST_CHECK_THROW(ParseEngine(""), UnknownEngineException);
}

} // namespace
} // namespace deaccent
