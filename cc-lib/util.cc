
#include "util.h"

#include <errno.h>
#include <stdio.h>
#include <sys/stat.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace std;

bool Util::isdir(const string &f) {
  struct stat st;
  return (0 == stat(f.c_str(), &st)) && (st.st_mode & S_IFDIR);
}

bool Util::ExistsFile(const string &s) {
  struct stat st;

  return 0 == stat(s.c_str(), &st);
}

std::optional<string> Util::ReadFileOpt(const string &s) {
  if (s.empty()) {
    errno = ENOENT;
    return nullopt;
  }
  if (Util::isdir(s)) {
    errno = EISDIR;
    return nullopt;
  }
  FILE *f = fopen(s.c_str(), "rb");
  if (f == nullptr) return nullopt;

  string ret;
  static constexpr size_t CHUNK = 1 << 16;
  char buf[CHUNK];
  for (;;) {
    const size_t bytes_read = fread(buf, 1, CHUNK, f);
    ret.append(buf, bytes_read);
    if (bytes_read < CHUNK) {
      if (ferror(f)) {
        // Keep errno from the failed read.
        const int err = errno;
        fclose(f);
        errno = err != 0 ? err : EIO;
        return nullopt;
      }
      break;
    }
  }
  fclose(f);
  return {std::move(ret)};
}

string Util::ReadFile(const string &s) {
  std::optional<string> contents = ReadFileOpt(s);
  if (!contents.has_value()) return "";
  return std::move(contents.value());
}

bool Util::WriteFile(const string &fn, const string &s) {
  FILE *f = fopen(fn.c_str(), "wb");
  if (f == nullptr) return false;

  const size_t len = s.length();
  const size_t wrote_len = fwrite(s.c_str(), 1, len, f);

  if (fclose(f) != 0) return false;

  return len == wrote_len;
}

vector<string> Util::SplitLines(string_view s) {
  vector<string> v;
  while (!s.empty()) {
    size_t nl = s.find('\n');
    string_view line = s.substr(0, nl);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    v.emplace_back(line);
    if (nl == string_view::npos) break;
    s.remove_prefix(nl + 1);
  }
  return v;
}

bool Util::StartsWith(string_view big, string_view little) {
  if (big.size() < little.size()) return false;
  return big.substr(0, little.size()) == little;
}

bool Util::TryStripPrefix(string_view prefix, string *s) {
  if (StartsWith(*s, prefix)) {
    *s = s->substr(prefix.length(), string::npos);
    return true;
  }
  return false;
}

bool Util::remove(const string &f) {
  if (!ExistsFile(f)) return true;
  return 0 == ::remove(f.c_str());
}
