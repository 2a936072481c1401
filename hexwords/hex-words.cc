// Finds all the words in a given wordlist that can be created with
// hexadecimal numbers.
//
//   hex-words [-o out.txt] [-t] wordlist.txt

#include <optional>
#include <stdio.h>
#include <string>
#include <vector>

#include "hexwords.h"

using namespace std;

static constexpr const char *VERSION = "0.1.0";

static void Usage(FILE *f) {
  fprintf(f,
          "Finds all the words in a given wordlist that can be created "
          "with hexadecimal numbers\n"
          "\n"
          "Usage: hex-words [OPTIONS] <PATH>\n"
          "\n"
          "Arguments:\n"
          "  <PATH>                 Path to the wordlist. NOTE: We're "
          "looking for a TXT file.\n"
          "\n"
          "Options:\n"
          "  -o, --output <OUTPUT>  Path to output the found words.\n"
          "  -t, --translate        If provided, will append the hex "
          "translation\n"
          "  -h, --help             Print help\n"
          "  -V, --version          Print version\n");
}

static int UsageError(const string &msg) {
  fprintf(stderr, "error: %s\n\n", msg.c_str());
  Usage(stderr);
  return 2;
}

int main(int argc, char **argv) {
  vector<string> args(argv + 1, argv + argc);
  HexWords::Options options;
  string error;
  switch (HexWords::ParseCommandLine(args, &options, &error)) {
  case HexWords::Command::HELP:
    Usage(stdout);
    return 0;
  case HexWords::Command::VERSION:
    printf("hex-words %s\n", VERSION);
    return 0;
  case HexWords::Command::USAGE_ERROR:
    return UsageError(error);
  case HexWords::Command::RUN:
    break;
  }

  return HexWords::Run(options, stdout, stderr);
}
