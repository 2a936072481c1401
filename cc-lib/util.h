#ifndef _CC_LIB_UTIL_H
#define _CC_LIB_UTIL_H

#include <optional>
#include <stdio.h>
#include <string>
#include <string_view>
#include <vector>

struct Util {
  // Reads the whole file. Returns nullopt if the name is empty, is a
  // directory, or can't be opened or read; errno describes why.
  static std::optional<std::string> ReadFileOpt(const std::string &filename);
  // Same, but just returns "" on failure.
  static std::string ReadFile(const std::string &filename);

  static bool WriteFile(const std::string &filename,
                        const std::string &contents);

  // Splits on \n. A \r right before the newline is dropped. Unlike
  // splitting on every separator, a trailing newline does not produce
  // an empty final line, but a final line without a newline is kept.
  // SplitLines("a\r\nb\n") = {"a", "b"}
  // SplitLines("a\n\nb") = {"a", "", "b"}
  // SplitLines("") = {}
  static std::vector<std::string> SplitLines(std::string_view s);

  // True iff big starts with small.
  static bool StartsWith(std::string_view big, std::string_view small);

  // If s starts with the prefix, strip it and return true.
  static bool TryStripPrefix(std::string_view prefix, std::string *s);

  static bool ExistsFile(const std::string &f);

  /* does this file exist and is it a directory? */
  static bool isdir(const std::string &s);

  /* try to remove the file. If it
     doesn't exist or is successfully
     removed, then return true. */
  static bool remove(const std::string &f);

 private:
  Util() = delete;
};

#endif
