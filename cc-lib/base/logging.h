// cc-lib's assertion macros. A failed CHECK prints the file, line,
// condition and any streamed message to stderr, then aborts.
//
//   CHECK(ptr != nullptr) << "Couldn't open " << filename;
//   CHECK_EQ(a, b);

#ifndef _CC_LIB_BASE_LOGGING_H
#define _CC_LIB_BASE_LOGGING_H

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace logging_internal {

// Collects the message for a failed check; the destructor prints it
// and aborts.
class CheckFailure {
 public:
  CheckFailure(const char *file, int line) {
    stream_ << "[FATAL " << file << ":" << line << "] ";
  }

  ~CheckFailure() {
    stream_ << "\n";
    std::cerr << stream_.str();
    std::cerr.flush();
    abort();
  }

  std::ostream &stream() { return stream_; }

 private:
  std::ostringstream stream_;

  CheckFailure(const CheckFailure &) = delete;
  CheckFailure &operator =(const CheckFailure &) = delete;
};

// Lets CHECK expand to an expression of type void in both branches
// of the conditional.
struct Voidify {
  // Precedence lower than << but higher than ?:.
  void operator &(std::ostream &) {}
};

template<class A, class B>
std::string *MakeCheckOpString(const A &a, const B &b, const char *expr) {
  std::ostringstream ss;
  ss << expr << " (" << a << " vs. " << b << ")";
  return new std::string(ss.str());
}

#define DEFINE_CHECK_OP_IMPL(name, op)                                  \
  template<class A, class B>                                            \
  inline std::string *name##Impl(const A &a, const B &b,                \
                                 const char *expr) {                    \
    if (a op b) return nullptr;                                         \
    return MakeCheckOpString(a, b, expr);                               \
  }

DEFINE_CHECK_OP_IMPL(Check_EQ, ==)
DEFINE_CHECK_OP_IMPL(Check_NE, !=)
DEFINE_CHECK_OP_IMPL(Check_LE, <=)
DEFINE_CHECK_OP_IMPL(Check_LT, <)
DEFINE_CHECK_OP_IMPL(Check_GE, >=)
DEFINE_CHECK_OP_IMPL(Check_GT, >)
#undef DEFINE_CHECK_OP_IMPL

// Owns the failure string (if any) produced by a Check_*Impl.
struct CheckOpResult {
  explicit CheckOpResult(std::string *s) : str(s) {}
  ~CheckOpResult() { delete str; }
  CheckOpResult(const CheckOpResult &) = delete;
  CheckOpResult &operator =(const CheckOpResult &) = delete;
  explicit operator bool() const { return str != nullptr; }
  std::string *str = nullptr;
};

}  // namespace logging_internal

#define CHECK(condition)                                                \
  (condition) ? (void)0 :                                               \
  logging_internal::Voidify() &                                         \
  logging_internal::CheckFailure(__FILE__, __LINE__).stream()           \
    << "Check failed: " #condition " "

#define CHECK_OP(name, op, a, b)                                        \
  while (logging_internal::CheckOpResult _check_result{                 \
        logging_internal::Check_##name##Impl(                           \
            (a), (b), #a " " #op " " #b)})                              \
    logging_internal::CheckFailure(__FILE__, __LINE__).stream()         \
      << "Check failed: " << *_check_result.str << " "

#define CHECK_EQ(a, b) CHECK_OP(EQ, ==, a, b)
#define CHECK_NE(a, b) CHECK_OP(NE, !=, a, b)
#define CHECK_LE(a, b) CHECK_OP(LE, <=, a, b)
#define CHECK_LT(a, b) CHECK_OP(LT, <, a, b)
#define CHECK_GE(a, b) CHECK_OP(GE, >=, a, b)
#define CHECK_GT(a, b) CHECK_OP(GT, >, a, b)

#endif
