#include "deaccent/normalizer.hh"
#include "deaccent/strip.hh"
#include "deaccent/utf8.hh"
#include "util/file_piece.hh"
#include "util/file_stream.hh"
#include "util/string_piece.hh"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>

#include <stdint.h>
#include <stdlib.h>

namespace deaccent {
namespace {

enum class InvalidPolicy { kSkip, kKeep, kFail };

struct Options {
  Engine engine;
  std::string icu_data;
  InvalidPolicy invalid;
};

InvalidPolicy ParseInvalid(const std::string &name) {
  if (name == "skip") return InvalidPolicy::kSkip;
  if (name == "keep") return InvalidPolicy::kKeep;
  if (name == "fail") return InvalidPolicy::kFail;
  std::cerr << "--invalid should be skip, keep, or fail, not " << name << std::endl;
  exit(1);
}

void ParseArgs(int argc, char *argv[], Options &out) {
  namespace po = boost::program_options;
  po::options_description desc("Diacritic removal options");
  std::string engine, invalid;
  desc.add_options()
    ("help,h", po::bool_switch(), "Show this help message")
    ("engine,e", po::value(&engine)->default_value("normalizer"), "ICU machinery to use: normalizer or transliterator")
    ("icu-data", po::value(&out.icu_data), "Directory containing ICU's data file, if ICU can't find it on its own")
    ("invalid", po::value(&invalid)->default_value("fail"), "What to do with lines that aren't UTF-8: skip, keep (copy unchanged), or fail");
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << '\n' << desc;
    exit(1);
  }
  if (vm["help"].as<bool>()) {
    std::cerr <<
      "Remove diacritics (accents, breathings, iota subscripts) from each line.\n"
      "Text is decomposed, nonspacing marks are deleted, and the rest is composed\n"
      "again.  This applies to marks in every script, not only Greek.\n" <<
      desc <<
      "Usage: " << argv[0] << " <in >out\n";
    exit(1);
  }
  try {
    out.engine = ParseEngine(engine);
  } catch (const UnknownEngineException &e) {
    std::cerr << e.what() << std::endl;
    exit(1);
  }
  out.invalid = ParseInvalid(invalid);
}

} // namespace
} // namespace deaccent

int main(int argc, char *argv[]) {
  using namespace deaccent;
  Options opt;
  ParseArgs(argc, argv, opt);

  std::unique_ptr<Stripper> stripper;
  try {
    if (!opt.icu_data.empty()) SetDataDirectory(opt.icu_data);
    stripper = MakeStripper(opt.engine);
  } catch (const UnicodeUnavailableException &e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  util::FilePiece in(0);
  util::FileStream out(1);
  util::StringPiece line;
  std::string stripped;
  uint64_t lines = 0, changed = 0, invalid = 0;
  try {
    while (in.ReadLineOrEOF(line)) {
      ++lines;
      if (!IsUTF8(line)) {
        ++invalid;
        if (opt.invalid == InvalidPolicy::kFail) {
          out.flush();
          std::cerr << "Line " << lines << " is not valid UTF-8.  Use --invalid skip or --invalid keep to continue past it." << std::endl;
          return 3;
        }
        if (opt.invalid == InvalidPolicy::kKeep) out << line << '\n';
        continue;
      }
      stripper->Apply(line, stripped);
      if (util::StringPiece(stripped) != line) ++changed;
      out << stripped << '\n';
    }
    out.flush();
  } catch (const util::Exception &e) {
    std::cerr << "Line " << lines << ": " << e.what() << std::endl;
    return 3;
  }
  std::cerr << "Stripped " << changed << " / " << lines << " lines with the " << EngineName(opt.engine) << " engine";
  if (invalid) std::cerr << "; " << invalid << " were not UTF-8";
  std::cerr << std::endl;
  return 0;
}
