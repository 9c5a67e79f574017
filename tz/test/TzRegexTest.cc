//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <tzlib/TzLib.hh>

#include <stdio.h>
#include <string.h>

#include <tzlib/TzRegex.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L> bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

const TzRegex *site() { return &TzREGEX("^\d+$"); }

int main()
{
  TzRegex::Captures c;

  {
    TzRegex r{"(\\d+)-(\\d+)"};
    CHECK(r.captureCount() == 3);
    CHECK(r.m("ab 12-34 cd", c) == 3);
    CHECK(c.size() == 5);
    CHECK(c.size() == 5 && c[0] == "ab " && c[1] == "12-34");
    CHECK(c.size() == 5 && c[2] == "12" && c[3] == "34" && c[4] == " cd");
    CHECK(!r.m("no digits"));
  }

  // unset groups
  {
    TzRegex r{"(a)|(b)"};
    CHECK(r.m("b", c) == 3);
    CHECK(c.size() == 5 && !c[2].data() && c[3] == "b");
  }

  // anchored continuation from an offset
  {
    const auto &r = TzREGEX("\G\d+");
    CHECK(!r.m("ab12", c, 0));
    CHECK(r.m("ab12", c, 2) && c[1] == "12");
    CHECK(!r.m("ab12", c, 5));
  }

  CHECK(site() == site());
  CHECK(site()->m("2024"));
  CHECK(!site()->m("2024a"));

  {
    TzRegex a{"a"};
    TzRegex b{std::move(a)};
    CHECK(b.m("xa"));
    CHECK(!a.captureCount());
  }

  CHECK(throws<TzRegexError>([]() { TzRegex r{"("}; }));
  {
    std::string what;
    try {
      TzRegex r{"[a"};
    } catch (const TzRegexError &e) {
      what = e.what();
    }
    CHECK(what.find("TzRegex Error") == 0);
  }
  CHECK(!strcmp(TzRegexError::strerror(PCRE_ERROR_NOMATCH), "NOMATCH"));
  CHECK(!strcmp(TzRegexError::strerror(-1000), "UNKNOWN"));

  return failed ? 1 : 0;
}
