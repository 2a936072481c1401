// Finds the words in a wordlist that can be spelled with hexadecimal
// digits, reading digits as letters: 0xB1ADE is "blade" and 0xF16 is
// "fig".

#ifndef _HEXWORDS_HEXWORDS_H
#define _HEXWORDS_HEXWORDS_H

#include <cstdint>
#include <optional>
#include <stdio.h>
#include <string>
#include <string_view>
#include <vector>

struct HexWords {
  // The letters that have a hex glyph. Exact characters; uppercase
  // letters are not in the alphabet.
  static constexpr std::string_view ALPHABET = "abcdefgilostz";
  // Returned by TranslateLetter for anything outside the alphabet.
  static constexpr char UNTRANSLATABLE = '?';

  // a-f become A-F, and g->6, i->1, l->1, o->0, s->5, t->7, z->2.
  // Everything else becomes UNTRANSLATABLE.
  static char TranslateLetter(char c);

  // True if every character of the word is in ALPHABET. The empty
  // word vacuously qualifies.
  static bool IsHexWord(std::string_view word);

  // "0x" followed by the translation of each character, e.g.
  // ToHex("zest") = "0x2E57". The word is treated as UTF-8, so a
  // multibyte character yields a single UNTRANSLATABLE.
  static std::string ToHex(std::string_view word);

  // Reads a newline-delimited wordlist into *words, replacing its
  // contents. Each line is trimmed of surrounding Unicode whitespace
  // and lines that are then empty are dropped. Returns false and sets
  // *error if the file can't be read or is not valid UTF-8; *words is
  // left untouched in that case.
  static bool ReadWordlist(const std::string &filename,
                           std::vector<std::string> *words,
                           std::string *error);

  // The words that pass IsHexWord, in input order. With translate,
  // each entry is "word:0x..." instead of the bare word.
  static std::vector<std::string> FindWords(
      const std::vector<std::string> &words, bool translate);

  enum class WriteStatus {
    OK,
    // Output file couldn't be created. Nothing was written.
    CREATE_FAILED,
    // Some line failed to write. Lines before it are left in the file.
    PARTIAL,
  };

  // Writes one result per line, creating or truncating the file.
  // On failure, *error gets the cause.
  static WriteStatus WriteResults(const std::string &filename,
                                  const std::vector<std::string> &results,
                                  std::string *error);

  struct Stats {
    int64_t total_words = 0;
    int64_t valid_words = 0;
    // valid / total as a percentage. 0 when there are no words.
    double Percentage() const;
  };

  // The "== STATS ==" block, including its trailing blank line.
  static std::string FormatStats(const Stats &stats);

  struct Options {
    std::string wordlist;
    // If absent, results are not written anywhere.
    std::optional<std::string> output;
    bool translate = false;
  };

  enum class Command {
    RUN,
    HELP,
    VERSION,
    // Bad arguments; the error says which.
    USAGE_ERROR,
  };

  // Parses the arguments after the program name:
  //   <path>                  exactly one, required for RUN
  //   -o <f>, -o<f>, -o=<f>   also --output <f>, --output=<f>
  //   -t, --translate
  //   -h, --help, -V, --version
  // Short flags can be grouped, as in "-to out.txt" or "-tofile".
  // Everything after "--" is positional. On RUN, fills *options.
  static Command ParseCommandLine(const std::vector<std::string> &args,
                                  Options *options,
                                  std::string *error);

  // The whole tool: read, filter, sort, optionally write, and print
  // stats. Normal output goes to out and errors to err. Returns the
  // process exit status.
  static int Run(const Options &options, FILE *out, FILE *err);

 private:
  HexWords() = delete;
};

#endif
