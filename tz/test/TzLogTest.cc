//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <tzlib/TzLib.hh>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <tzlib/TzLog.hh>
#include <tzlib/TzInit.hh>
#include <tzlib/TzCf.hh>
#include <tzlib/TzZones.hh>
#include <tzlib/TzFormats.hh>
#include <tzlib/TzTime.hh>
#include <tzlib/TzError.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L> bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

static const char *eastern = "EST5EDT,M3.2.0,M11.1.0";

struct Event {
  std::string	buf;
  int		severity;
};

static std::vector<Event> events;

static bool contains(const std::string &s, const char *t)
{
  return s.find(t) != std::string::npos;
}

void severities()
{
  CHECK(std::string{Tz::severity(Tz::Warning)} == "WARNING");
  CHECK(std::string{Tz::severity(99)} == "UNKNOWN");
  CHECK(Tz::severity("warning") == Tz::Warning);
  CHECK(Tz::severity("FATAL") == Tz::Fatal);
  CHECK(Tz::severity("3") == Tz::Error);
  CHECK(Tz::severity("bogus") == -1);
  CHECK(Tz::file("/a/b/c.cc") == "c.cc");
  CHECK(Tz::file("c.cc") == "c.cc");
}

void logging()
{
  TzLog::sink(TzLog::lambdaSink(
	[](const std::string &buf, const TzEventInfo &info) {
	  events.push_back(Event{buf, info.severity});
	}));
  TzLog::level(Tz::Info);

  events.clear();
  TzLOG(Info, "hello");
  CHECK(events.size() == 1);
  if (events.size() == 1) {
    const auto &buf = events[0].buf;
    CHECK(events[0].severity == Tz::Info);
    CHECK(contains(buf, " INFO logging() hello\n"));
    // YYYY/MM/DD HH:MM:SS.nnnnnnnnn
    CHECK(buf.length() > 30 && buf[4] == '/' && buf[7] == '/' &&
	buf[13] == ':' && buf[19] == '.');
  }

  events.clear();
  TzLOG(Debug, "hidden");
  CHECK(events.empty());

  TzLog::level(Tz::Warning);
  events.clear();
  TzLOG(Info, "hidden");
  int n = 42;
  TzLOG(Warning, ([&](auto &s) { s << "n=" << n; }));
  CHECK(events.size() == 1);
  CHECK(events.size() == 1 && contains(events[0].buf, "WARNING"));
  CHECK(events.size() == 1 && contains(events[0].buf, "n=42\n"));

  events.clear();
  try {
    Tz::findZone("No/Such_Zone");
  } catch (const TzError &e) {
    TzLOG(Error, e);
  }
  CHECK(events.size() == 1);
  CHECK(events.size() == 1 &&
      contains(events[0].buf, "unknown time zone \"No/Such_Zone\""));

  // fatal events record the source file
  events.clear();
  TzLOG(Fatal, "fatal");
  CHECK(events.size() == 1 && contains(events[0].buf, "\"TzLogTest.cc\":"));

  TzLog::level(Tz::Info);
}

void fileSink()
{
  char path[] = "/tmp/TzLogTestXXXXXX";
  int fd = mkstemp(path);
  CHECK(fd >= 0);
  if (fd < 0) return;
  close(fd);

  auto sink = TzLog::fileSink(TzSinkOptions{}.path(path).tzOffset(3600));
  CHECK(sink->type == TzSinkType::File);
  TzLog::sink(sink);
  TzLOG(Warning, "to file");
  TzLog::sink(nullptr);
  sink = nullptr;

  std::string s;
  if (FILE *f = fopen(path, "r")) {
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) s.append(buf, n);
    fclose(f);
  }
  unlink(path);
  CHECK(contains(s, " WARNING fileSink() to file\n"));
}

void init()
{
  TzLog::sink(TzLog::lambdaSink(
	[](const std::string &buf, const TzEventInfo &info) {
	  events.push_back(Event{buf, info.severity});
	}));

  Tz::init(nullptr);

  TzCf cf;
  cf.fromString(
      "log { level Warning }\n"
      "zone Eastern\n"
      "zones {\n"
      "  Eastern \"EST5EDT,M3.2.0,M11.1.0\"\n"
      "  India +05:30\n"
      "}\n"
      "formats { stamp \"%Y%m%d %Z\" }\n");
  Tz::init(&cf);

  CHECK(TzLog::level() == Tz::Warning);
  CHECK(Tz::findZone("Eastern")->name() == eastern);
  CHECK(Tz::findZone("India") == Tz::findZone(19800));
  CHECK(Tz::defaultZone()->name() == eastern);
  CHECK(TzFormats::instance()->exists("stamp"));
  CHECK((TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 0, 0}, Tz::defaultZone())
	.toString("stamp") == "20240115 EST"));

  {
    TzCf bad;
    bad.fromString("log { level Verbose }");
    CHECK(throws<TzCfError::Range>([&bad]() { Tz::init(&bad); }));
  }
  {
    TzCf bad;
    bad.fromString("zone No/Such_Zone");
    CHECK(throws<TzTimeError::UnknownZone>([&bad]() { Tz::init(&bad); }));
  }
  {
    TzCf bad;
    bad.fromString("zones { Bad [ a, b ] }");
    CHECK(throws<TzCfError::Required>([&bad]() { Tz::init(&bad); }));
  }
  {
    TzCf bad;
    bad.fromString("log { tzOffset bogus }");
    CHECK(throws<TzTimeError::BadFormat>([&bad]() { Tz::init(&bad); }));
  }

  Tz::defaultZone(nullptr);
  TzLog::level(Tz::Info);
  TzFormats::instance()->del("stamp");
}

// level changes race with logging threads
void concurrentLevel()
{
  std::atomic<unsigned> count = 0;
  TzLog::sink(TzLog::lambdaSink(
	[&count](const std::string &, const TzEventInfo &) { ++count; }));
  TzLog::level(Tz::Fatal);
  std::thread logger([]() {
    for (unsigned i = 0; i < 1000; i++) TzLOG(Warning, "concurrent");
  });
  for (unsigned i = 0; i < 1000; i++)
    TzLog::level((i & 1) ? Tz::Warning : Tz::Fatal);
  logger.join();
  CHECK(TzLog::level() == Tz::Warning);
  CHECK(count.load() <= 1000);
  TzLog::sink(nullptr);
  TzLog::level(Tz::Info);
}

int main()
{
  severities();
  logging();
  concurrentLevel();
  fileSink();
  init();
  TzLog::sink(nullptr);
  return failed ? 1 : 0;
}
