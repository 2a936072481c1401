
#include "hexwords.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <errno.h>
#include <optional>
#include <stdio.h>
#include <string.h>
#include <string>
#include <string_view>
#include <vector>

#include "../cc-lib/base/logging.h"
#include "../cc-lib/base/stringprintf.h"
#include "../cc-lib/util.h"
#include "../cc-lib/utf8.h"

using namespace std;

namespace {
using Table = std::array<char, 256>;

constexpr Table MakeTable() {
  Table t{};
  for (char &c : t) c = HexWords::UNTRANSLATABLE;
  t['a'] = 'A';
  t['b'] = 'B';
  t['c'] = 'C';
  t['d'] = 'D';
  t['e'] = 'E';
  t['f'] = 'F';
  t['g'] = '6';
  t['i'] = '1';
  t['l'] = '1';
  t['o'] = '0';
  t['s'] = '5';
  t['t'] = '7';
  t['z'] = '2';
  return t;
}

constexpr Table TRANSLATION = MakeTable();

// Every letter of the alphabet has an entry, and nothing else does.
constexpr bool TableMatchesAlphabet() {
  int count = 0;
  for (int i = 0; i < 256; i++) {
    if (TRANSLATION[i] == HexWords::UNTRANSLATABLE) continue;
    if (HexWords::ALPHABET.find((char)i) == string_view::npos) return false;
    count++;
  }
  return count == (int)HexWords::ALPHABET.size();
}
static_assert(TableMatchesAlphabet(), "translation table is out of sync");
}  // namespace

char HexWords::TranslateLetter(char c) {
  return TRANSLATION[(uint8_t)c];
}

bool HexWords::IsHexWord(string_view word) {
  for (char c : word)
    if (TranslateLetter(c) == UNTRANSLATABLE)
      return false;
  return true;
}

string HexWords::ToHex(string_view word) {
  string hex = "0x";
  hex.reserve(word.size() + 2);
  for (char c : word) {
    // One glyph per codepoint; the lead byte stands for the whole
    // character.
    if (UTF8::IsContinuation(c)) continue;
    hex += TranslateLetter(c);
  }
  return hex;
}

bool HexWords::ReadWordlist(const string &filename,
                            vector<string> *words,
                            string *error) {
  CHECK(words != nullptr);
  std::optional<string> contents = Util::ReadFileOpt(filename);
  if (!contents.has_value()) {
    if (error != nullptr) *error = filename + ": " + strerror(errno);
    return false;
  }

  vector<string> lines = Util::SplitLines(contents.value());
  vector<string> read;
  read.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); i++) {
    if (!UTF8::IsValid(lines[i])) {
      if (error != nullptr) {
        *error = StringPrintf("%s: line %d is not valid UTF-8",
                              filename.c_str(), (int)(i + 1));
      }
      return false;
    }
    string word = UTF8::Trim(lines[i]);
    if (!word.empty()) read.push_back(std::move(word));
  }
  words->swap(read);
  return true;
}

vector<string> HexWords::FindWords(const vector<string> &words,
                                   bool translate) {
  vector<string> found;
  for (const string &word : words) {
    if (!IsHexWord(word)) continue;
    if (translate) {
      found.push_back(StringPrintf("%s:%s", word.c_str(),
                                   ToHex(word).c_str()));
    } else {
      found.push_back(word);
    }
  }
  return found;
}

HexWords::WriteStatus HexWords::WriteResults(const string &filename,
                                             const vector<string> &results,
                                             string *error) {
  FILE *f = fopen(filename.c_str(), "wb");
  if (f == nullptr) {
    if (error != nullptr) *error = filename + ": " + strerror(errno);
    return WriteStatus::CREATE_FAILED;
  }

  for (const string &s : results) {
    const size_t wrote_len = fwrite(s.data(), 1, s.size(), f);
    if (wrote_len != s.size() || EOF == fputc('\n', f)) {
      if (error != nullptr) *error = filename + ": " + strerror(errno);
      // Whatever made it out stays in the file.
      fclose(f);
      return WriteStatus::PARTIAL;
    }
  }

  // Buffered lines may only fail here.
  if (fclose(f) != 0) {
    if (error != nullptr) *error = filename + ": " + strerror(errno);
    return WriteStatus::PARTIAL;
  }
  return WriteStatus::OK;
}

double HexWords::Stats::Percentage() const {
  CHECK_GE(total_words, 0);
  CHECK_LE(valid_words, total_words);
  if (total_words == 0) return 0.0;
  return (double)valid_words / (double)total_words * 100.0;
}

string HexWords::FormatStats(const Stats &stats) {
  string s = "== STATS ==\n";
  StringAppendF(&s, "Total Words in Wordlist: %lld\n",
                (long long)stats.total_words);
  StringAppendF(&s, "Valid Words: %lld\n", (long long)stats.valid_words);
  StringAppendF(&s,
                "Percentage of wordlist expressable as Hexadecimals: "
                "~%.4f%%\n\n",
                stats.Percentage());
  return s;
}

HexWords::Command HexWords::ParseCommandLine(const vector<string> &args,
                                             Options *options,
                                             string *error) {
  CHECK(options != nullptr);
  auto Fail = [error](const string &msg) {
      if (error != nullptr) *error = msg;
      return Command::USAGE_ERROR;
    };

  Options opts;
  vector<string> positional;
  bool only_positional = false;

  for (size_t i = 0; i < args.size(); i++) {
    const string &arg = args[i];
    if (only_positional || arg.size() < 2 || arg[0] != '-') {
      positional.push_back(arg);
      continue;
    }

    if (arg == "--") {
      only_positional = true;
      continue;
    }

    string name = arg;
    if (Util::TryStripPrefix("--", &name)) {
      const size_t eq = name.find('=');
      const string key = name.substr(0, eq);
      if (key == "output") {
        if (eq != string::npos) {
          opts.output = name.substr(eq + 1);
        } else if (i + 1 < args.size()) {
          opts.output = args[++i];
        } else {
          return Fail("a value is required for '--output <OUTPUT>'");
        }
        continue;
      }

      if (key != "help" && key != "version" && key != "translate")
        return Fail("unexpected argument '" + arg + "'");
      if (eq != string::npos)
        return Fail("unexpected value for '--" + key + "'");
      if (key == "help") return Command::HELP;
      if (key == "version") return Command::VERSION;
      opts.translate = true;
      continue;
    }

    // A group of short flags. -o takes the rest of the group (after an
    // optional '=') or else the next argument.
    for (size_t j = 1; j < arg.size(); j++) {
      const char c = arg[j];
      if (c == 'h') return Command::HELP;
      if (c == 'V') return Command::VERSION;
      if (c == 't') {
        opts.translate = true;
        continue;
      }
      if (c != 'o')
        return Fail(StringPrintf("unexpected argument '-%c'", c));

      string value = arg.substr(j + 1);
      if (!value.empty() && value[0] == '=') value.erase(0, 1);
      if (j + 1 < arg.size()) {
        opts.output = value;
      } else if (i + 1 < args.size()) {
        opts.output = args[++i];
      } else {
        return Fail("a value is required for '-o <OUTPUT>'");
      }
      break;
    }
  }

  if (positional.empty())
    return Fail("the required argument <PATH> was not provided");
  if (positional.size() > 1)
    return Fail("unexpected argument '" + positional[1] + "'");

  opts.wordlist = positional[0];
  *options = std::move(opts);
  return Command::RUN;
}

int HexWords::Run(const Options &options, FILE *out, FILE *err) {
  vector<string> words;
  string error;
  if (!ReadWordlist(options.wordlist, &words, &error)) {
    fprintf(err, "Error: %s\n", error.c_str());
    return 1;
  }

  vector<string> results = FindWords(words, options.translate);
  std::sort(results.begin(), results.end());

  int status = 0;
  if (options.output.has_value()) {
    const string &outfile = options.output.value();
    switch (WriteResults(outfile, results, &error)) {
    case WriteStatus::OK:
      fprintf(out, "Successfully wrote results to %s!\n\n", outfile.c_str());
      break;
    case WriteStatus::CREATE_FAILED:
      fprintf(err, "Error: %s\n", error.c_str());
      return 1;
    case WriteStatus::PARTIAL:
      fprintf(out, "Failed to write results!\n");
      fprintf(err, "%s\n", error.c_str());
      // Stats don't depend on the file, so still report them.
      status = 1;
      break;
    }
  }

  Stats stats;
  stats.total_words = (int64_t)words.size();
  stats.valid_words = (int64_t)results.size();
  fprintf(out, "%s", FormatStats(stats).c_str());
  fflush(out);
  return status;
}
