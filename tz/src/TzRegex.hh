//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// PCRE regular expression wrapper

#ifndef TzRegex_HH
#define TzRegex_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <pcre.h>

#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <tzlib/TzError.hh>

class TzAPI TzRegexError : public TzError {
public:
  TzRegexError(const char *message, int code, int offset) :
      m_message{message}, m_code{code}, m_offset{offset} { }

  static const char *strerror(int);

  int code() const { return m_code; }

  void print_(std::ostream &s) const {
    if (m_message) {
      s << "TzRegex Error \"" << m_message << "\" (" << m_code << ")"
	" at offset " << m_offset;
    } else {
      s << "TzRegex pcre_exec() Error: " << strerror(m_code);
    }
  }

private:
  const char	*m_message = nullptr;
  int		m_code = 0;
  int		m_offset = -1;
};

class TzAPI TzRegex {
  TzRegex(const TzRegex &) = delete;
  TzRegex &operator =(const TzRegex &) = delete;

public:
  using Capture = std::string_view;
  using Captures = std::vector<Capture>;

  // pcre_compile() options
  TzRegex(const char *pattern, int options = PCRE_UTF8);

  TzRegex(TzRegex &&r) noexcept :
      m_regex{r.m_regex}, m_captureCount{r.m_captureCount} {
    r.m_regex = nullptr;
    r.m_captureCount = 0;
  }
  TzRegex &operator =(TzRegex &&r) noexcept {
    std::swap(m_regex, r.m_regex);
    std::swap(m_captureCount, r.m_captureCount);
    return *this;
  }

  ~TzRegex();

  unsigned captureCount() const { return m_captureCount; }

  // options below are pcre_exec() options

  // captures[0] is $`
  // captures[1] is $&
  // captures[2] is $1
  // captures[n - 1] is $' (where n = number of captured substrings + 3)
  // return value is number of captures excluding $` and $', i.e. (n - 2)
  //   0 implies no match
  //   1 implies $`, $&, $' captured (n == 3)
  //   2 implies $`, $&, $1, $' captured (n == 4)
  // unset groups are captured as empty views with a null data pointer
  unsigned m(std::string_view s, unsigned offset = 0, int options = 0) const {
    std::vector<int> ovector;
    return exec(s, offset, options, ovector);
  }
  unsigned m(std::string_view s,
      Captures &captures, unsigned offset = 0, int options = 0) const {
    std::vector<int> ovector;
    unsigned i = exec(s, offset, options, ovector);
    if (i) capture(s, ovector, captures);
    return i;
  }

private:
  unsigned exec(std::string_view s,
      unsigned offset, int options, std::vector<int> &ovector) const;
  void capture(std::string_view s,
      const std::vector<int> &ovector, Captures &captures) const;

  pcre		*m_regex = nullptr;
  unsigned	m_captureCount = 0;
};

// quote the pattern using the pre-processor to avoid having to double
// backslash the RE, then strip the leading/trailing double-quotes;
// each expansion site compiles its pattern once, on first use
#define TzREGEX(pattern_, ...) ([]() -> const TzRegex & { \
  static const TzRegex regex_{ \
    std::string{#pattern_ + 1, sizeof(#pattern_) - 3}.c_str() \
    __VA_OPT__(,) __VA_ARGS__}; \
  return regex_; \
}())

#endif /* TzRegex_HH */
