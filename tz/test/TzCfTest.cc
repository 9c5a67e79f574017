//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <tzlib/TzLib.hh>

#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>

#include <tzlib/TzCf.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L> bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

static const char *text =
  "# zone settings\n"
  "zone America/New_York\n"
  "log {\n"
  "  level Warning	# trailing comment\n"
  "  path \"/tmp/tz log.txt\"\n"
  "}\n"
  "to [ UTC, \"+05:30\", Asia/Tokyo ]\n"
  "empty [ ]\n"
  "n 42\n"
  "big 8589934592\n"
  "flag yes\n"
  "quoted \"say \\\"hi\\\" \\\\ bye\"\n"
  "escaped a\\ b\n";

void parse()
{
  TzCf cf;
  cf.fromString(text);

  CHECK(cf.get("zone") == "America/New_York");
  CHECK(cf.get("log.level") == "Warning");
  CHECK(cf.getCf("log"));
  CHECK(cf.getCf("log")->get("path") == "/tmp/tz log.txt");
  {
    auto to = cf.getStrArray("to");
    CHECK(to && to->size() == 3);
    CHECK(to && (*to)[0] == "UTC" && (*to)[1] == "+05:30");
  }
  CHECK(cf.getStrArray("empty") && cf.getStrArray("empty")->empty());
  CHECK(cf.getInt("n", 0, 100) == 42);
  CHECK(cf.getInt64("big", 0, INT64_MAX) == 8589934592LL);
  CHECK(cf.getBool("flag"));
  CHECK(cf.get("quoted") == "say \"hi\" \\ bye");
  CHECK(cf.get("escaped") == "a b");
  CHECK(cf.count() == 9);

  // defaults
  CHECK(cf.get("missing").empty());
  CHECK(cf.get("missing", "x") == "x");
  CHECK(cf.getBool("missing", true));
  CHECK(cf.getInt("missing", 0, 10, 5) == 5);
  CHECK(!cf.getStrArray("missing"));
  CHECK(!cf.getCf("zone"));
  CHECK(!cf.exists("log.missing"));
  CHECK(cf.exists("log.level"));

  // errors
  CHECK(throws<TzCfError::Required>([&cf]() { cf.get<true>("missing"); }));
  {
    std::string key;
    try {
      cf.getCf("log")->getInt<true>("missing", 0, 10);
    } catch (const TzCfError::Required &e) {
      key = e.key();
    }
    CHECK(key == "log.missing");
  }
  CHECK(throws<TzCfError::Range>([&cf]() { cf.getInt("n", 0, 10); }));
  CHECK(throws<TzCfError::Range>([&cf]() { cf.getInt("zone", 0, 10); }));
  CHECK(throws<TzCfError::BadBool>([&cf]() { cf.getBool("zone"); }));
  CHECK(throws<TzCfError::Required>([&cf]() {
    cf.getStrArray<true>("zone");
  }));
}

void scan()
{
  TzCf cf;
  CHECK(cf.scanBool("b", "On", false));
  CHECK(cf.scanBool("b", "Y", false));
  CHECK(!cf.scanBool("b", "FALSE", true));
  CHECK(!cf.scanBool("b", "0", true));
  CHECK(cf.scanBool("b", "", true));
  CHECK(cf.scanInt("i", "+5", 0, 10, 0) == 5);
  CHECK(cf.scanInt("i", "-5", -10, 10, 0) == -5);
  CHECK(throws<TzCfError::Range>([&cf]() { cf.scanInt("i", "5x", 0, 10, 0); }));
}

void syntax()
{
  auto bad = [](const char *s) {
    return throws<TzCfError::Syntax>([s]() { TzCf cf; cf.fromString(s); });
  };
  CHECK(bad("a {"));
  CHECK(bad("}"));
  CHECK(bad("a [ b c ]"));
  CHECK(bad("a [ b,"));
  CHECK(bad("a \"unterminated"));
  CHECK(bad("a"));
  CHECK(bad("a b\nc d { e f }"));

  std::string what;
  try {
    TzCf cf;
    cf.fromString("a 1\nb [ x y ]\n", "test.cf");
  } catch (const TzCfError::Syntax &e) {
    what = e.what();
  }
  CHECK(what == "\"test.cf\":2 syntax error near 'y'");

  // a nested scope cannot replace a value
  CHECK(bad("a b\na { c d }"));
}

void edit()
{
  TzCf cf;
  cf.set("a.b.c", "1");
  CHECK(cf.get("a.b.c") == "1");
  CHECK(cf.getCf("a.b"));
  CHECK(cf.getCf("a.b")->fullKey("c") == "a.b.c");
  cf.setStrArray("a.list", { "x", "y" });
  CHECK(cf.getStrArray("a.list")->size() == 2);
  cf.unset("a.b.c");
  CHECK(!cf.exists("a.b.c"));
  CHECK(cf.exists("a.b"));

  auto child = TzCf::make();
  child->set("k", "v");
  cf.setCf("child", child);
  CHECK(cf.get("child.k") == "v");
  CHECK(child->fullKey("k") == "child.k");

  TzCf base, overlay;
  base.fromString("log { level Info path a.log } zone UTC");
  overlay.fromString("log { level Debug } extra 1");
  base.merge(overlay);
  CHECK(base.get("log.level") == "Debug");
  CHECK(base.get("log.path") == "a.log");
  CHECK(base.get("zone") == "UTC");
  CHECK(base.get("extra") == "1");
}

void print()
{
  TzCf cf;
  cf.fromString(text);
  std::string s = cf.toString();
  CHECK(s.find("log {\n  level Warning\n") != std::string::npos);
  CHECK(s.find("to [ UTC, +05:30, Asia/Tokyo ]\n") != std::string::npos);
  CHECK(s.find("escaped \"a b\"\n") != std::string::npos);

  TzCf cf2;
  cf2.fromString(s);
  CHECK(cf2.toString() == s);
  CHECK(cf2.get("quoted") == cf.get("quoted"));
}

static TzOpt options[] = {
  { 'z', "zone", TzOptType::Param, "zone" },
  { 't', "to", TzOptType::Array, "to" },
  { 'u', "utc", TzOptType::Flag, "utc" },
  { 'v', "verbose", TzOptType::Flag, "verbose" },
  { 0 }
};

void args()
{
  {
    TzCf cf;
    unsigned n = cf.fromArgs(options, {
      "tzconv", "-uv", "-z", "UTC", "--to=Asia/Tokyo,+05:30",
      "2024-01-01T00:00:00", "\\-5"
    });
    CHECK(n == 3);
    CHECK(cf.get("#") == "3");
    CHECK(cf.get("0") == "tzconv");
    CHECK(cf.get("1") == "2024-01-01T00:00:00");
    CHECK(cf.get("2") == "-5");
    CHECK(cf.getBool("utc") && cf.getBool("verbose"));
    CHECK(cf.get("zone") == "UTC");
    auto to = cf.getStrArray("to");
    CHECK(to && to->size() == 2 && (*to)[1] == "+05:30");
  }
  {
    TzCf cf;
    cf.fromArgs(options, { "tzconv", "--zone=\\-05:00", "-t", "a\\,b,c" });
    CHECK(cf.get("zone") == "-05:00");
    auto to = cf.getStrArray("to");
    CHECK(to && to->size() == 2 && (*to)[0] == "a,b");
  }
  {
    TzCf cf;
    cf.fromArgs(options, { "tzconv", "-z", "\\-05:00" });
    CHECK(cf.get("zone") == "-05:00");
  }

  auto usage = [](TzCf::StrArray args) {
    return throws<TzCfError::Usage>([&args]() {
      TzCf cf;
      cf.fromArgs(options, args);
    });
  };
  CHECK(usage({ "tzconv", "-x" }));
  CHECK(usage({ "tzconv", "-z" }));
  CHECK(usage({ "tzconv", "--utc=1" }));
  CHECK(usage({ "tzconv", "--zone" }));
  CHECK(usage({ "tzconv", "--bogus" }));
  CHECK(usage({ "tzconv", "-5" }));

  char arg0[] = "tzconv", arg1[] = "-u";
  char *argv[] = { arg0, arg1, nullptr };
  auto args = TzCf::args(2, argv);
  CHECK(args.size() == 2 && args[1] == "-u");
}

void file()
{
  char path[] = "/tmp/TzCfTestXXXXXX";
  int fd = mkstemp(path);
  CHECK(fd >= 0);
  if (fd < 0) return;
  std::string s = "zone UTC\nlog { level Error }\n";
  CHECK(write(fd, s.data(), s.length()) == ssize_t(s.length()));
  close(fd);

  TzCf cf;
  cf.fromFile(path);
  CHECK(cf.get("zone") == "UTC");
  CHECK(cf.get("log.level") == "Error");
  unlink(path);

  CHECK(throws<TzCfError::FileOpenError>([&path]() {
    TzCf cf;
    cf.fromFile(path);
  }));
}

int main()
{
  parse();
  scan();
  syntax();
  edit();
  print();
  args();
  file();
  return failed ? 1 : 0;
}
