//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <tzlib/TzLib.hh>

#include <stdio.h>

#include <thread>
#include <vector>

#include <tzlib/TzTime.hh>
#include <tzlib/TzFormats.hh>
#include <tzlib/TzCf.hh>
#include <tzlib/TzError.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L> bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

static const char *eastern = "EST5EDT,M3.2.0,M11.1.0";

// generic over TzDateTime and TzTime
template <typename T>
TzMatchTimeLike<T, int64_t> epoch(const T &v) {
  return v.utc().as_time_t();
}

void construction()
{
  CHECK(!TzTime{});

  auto z = Tz::findZone(eastern);
  TzDateTime utc{2024, 1, 15, 17, 30, 45};
  auto t = TzTime::fromUTC(utc, z);
  CHECK(t);
  CHECK(t.zone() == z);
  CHECK(t.utc() == utc);
  CHECK((t.local() == TzDateTime{2024, 1, 15, 12, 30, 45}));
  CHECK(t.utcOffset() == -18000);
  CHECK(t.abbrev() == "EST");
  CHECK(!t.dst());
  CHECK(!t.isUTC());

  auto l = TzTime::fromLocal(TzDateTime{2024, 1, 15, 12, 30, 45}, z);
  CHECK(l.utc() == utc);
  CHECK(l == t);

  auto u = TzTime::fromUTC(utc, Tz::findZone("GMT"));
  CHECK(u.isUTC());
  CHECK(u.local() == utc);

  CHECK(epoch(t) == 1705339845);
  CHECK(epoch(utc) == 1705339845);

  CHECK(TzTime::now(z));
  CHECK(TzTime::now().zone() == Tz::defaultZone());

  auto f = TzTime::fromUTC(utc, z);
  CHECK(!f.frozen());
  f.freeze();
  CHECK(f.frozen());
  CHECK(f.abbrev() == "EST");
  CHECK(throws<TzTimeError::Frozen>([&f]() { f += TzDuration::hours(1); }));
  CHECK(throws<TzTimeError::Frozen>([&f]() { f -= TzDuration::days(1); }));
  CHECK(f.utc() == utc);
  auto g = f;
  CHECK(g.frozen());
  auto h = TzTime::fromUTC(utc, z);
  h += TzDuration::hours(1);
  CHECK((h.utc() == utc + 3600));

  // an explicit offset makes the value an instant
  auto p = TzTime::parse("2024-01-15T12:30:45", z);
  CHECK(p.utc() == utc);
  auto q = TzTime::parse("2024-01-15T12:00+05", z);
  CHECK((q.utc() == TzDateTime{2024, 1, 15, 7, 0, 0}));
  CHECK((q.local() == TzDateTime{2024, 1, 15, 2, 0, 0}));
  auto r = TzTime::parse("2024-01-15T17:30:45Z", z);
  CHECK(r.utc() == utc);
  CHECK(throws<TzTimeError::BadFormat>([&z]() { TzTime::parse("bad", z); }));
}

// concurrent readers of a shared value
void sharing()
{
  auto z = Tz::findZone(eastern);
  const auto t = TzTime::fromUTC(TzDateTime{2024, 11, 3, 6, 30, 0}, z);
  std::vector<std::thread> threads;
  std::vector<int> ok(4, 0);
  for (unsigned i = 0; i < 4; i++)
    threads.emplace_back([&t, &ok, i]() {
      bool ok_ = true;
      for (unsigned j = 0; j < 1000; j++)
	if (t.abbrev() != "EST" ||
	    t.local() != TzDateTime{2024, 11, 3, 1, 30, 0}) ok_ = false;
      ok[i] = ok_;
    });
  for (auto &thread : threads) thread.join();
  CHECK((ok == std::vector<int>{1, 1, 1, 1}));
}

void conversion()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  auto ist = t.inZone("+05:30");
  CHECK((ist.local() == TzDateTime{2024, 1, 15, 23, 0, 45}));
  CHECK(ist == t);
  CHECK(t.inZone(eastern).zone() == z);

  auto cet = t.localtime(3600);
  CHECK((cet.local() == TzDateTime{2024, 1, 15, 18, 30, 45}));
  CHECK(cet.utcOffset() == 3600);
}

void arithmetic()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  CHECK(((t + TzDuration::hours(2)) - t) == 7200.0);
  CHECK(((t + 90) - t) == 90.0);
  CHECK(((t - 90) - t) == -90.0);
  CHECK(((t + TzDuration::days(1)).local() ==
	TzDateTime{2024, 1, 16, 12, 30, 45}));
  CHECK(((t + TzDuration::months(1)).local() ==
	TzDateTime{2024, 2, 15, 12, 30, 45}));
  CHECK((t.since(TzDuration::minutes(1)) == t + 60));
  CHECK((t.in(TzDuration::minutes(1)) == t + 60));
  CHECK((t.ago(TzDuration::minutes(1)) == t - 60));
  CHECK((t.advance(TzDuration::years(1)).local() ==
	TzDateTime{2025, 1, 15, 12, 30, 45}));

  auto u = t;
  u += TzDuration::seconds(30);
  CHECK((u - t) == 30.0);
  u -= TzDuration::seconds(30);
  CHECK(u == t);

  // month-end clamping is applied to the local time
  auto e = TzTime::fromLocal(TzDateTime{2024, 1, 31, 10, 0, 0}, z);
  CHECK(((e + TzDuration::months(1)).local() ==
	TzDateTime{2024, 2, 29, 10, 0, 0}));
}

void comparison()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);
  auto u = t.inZone("UTC");

  CHECK(t == u);
  CHECK(t.eql(u));
  CHECK(!t.cmp(u));
  CHECK(t < t + 1);
  CHECK(t + 1 > t);
  CHECK(t <= u);
  CHECK((t == TzDateTime{2024, 1, 15, 17, 30, 45}));
  CHECK((t < TzDateTime{2024, 1, 15, 17, 30, 46}));
  CHECK(t.cmp(TzDateTime{2024, 1, 15, 17, 30, 44}) > 0);
}

void change()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  auto h = t.change(TzChange{}.hour(9));
  CHECK((h.local() == TzDateTime{2024, 1, 15, 9, 0, 0}));
  CHECK(h.zone() == z);

  auto d = t.change(TzChange{}.year(2023).day(1));
  CHECK((d.local() == TzDateTime{2023, 1, 1, 12, 30, 45}));

  auto u = t.change(TzChange{}.zone("UTC"));
  CHECK((u.utc() == TzDateTime{2024, 1, 15, 12, 30, 45}));
  CHECK(u.isUTC());

  auto o = t.change(TzChange{}.offset("+02:00"));
  CHECK((o.utc() == TzDateTime{2024, 1, 15, 10, 30, 45}));
  CHECK(o.utcOffset() == 7200);

  CHECK(throws<TzTimeError::ConflictingZoneSpec>([&t]() {
    t.change(TzChange{}.zone("UTC").offset("+02:00"));
  }));
  CHECK(throws<TzTimeError::BadFormat>([&t]() {
    t.change(TzChange{}.offset("bogus"));
  }));
  CHECK(throws<TzTimeError::UnknownZone>([&t]() {
    t.change(TzChange{}.zone("No/Such_Zone"));
  }));
  CHECK(throws<TzTimeError::BadField>([&t]() {
    t.change(TzChange{}.month(13));
  }));
}

void delegation()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  CHECK(t.year() == 2024 && t.month() == 1 && t.day() == 15);
  CHECK(t.hour() == 12 && t.minute() == 30 && t.second() == 45);
  CHECK(t.wday() == 1 && t.yday() == 15);

  CHECK((t.beginningOfDay().utc() == TzDateTime{2024, 1, 15, 5, 0, 0}));
  CHECK((t.endOfDay().local() == TzDateTime{2024, 1, 15}.endOfDay()));
  CHECK((t.middleOfDay().local() == TzDateTime{2024, 1, 15, 12, 0, 0}));
  CHECK((t.beginningOfHour().local() == TzDateTime{2024, 1, 15, 12, 0, 0}));
  CHECK((t.beginningOfMonth().local() == TzDateTime{2024, 1, 1}));
  CHECK((t.beginningOfYear().local() == TzDateTime{2024, 1, 1}));
  CHECK((t.tomorrow().local() == TzDateTime{2024, 1, 16, 12, 30, 45}));
  CHECK((t.yesterday().local() == TzDateTime{2024, 1, 14, 12, 30, 45}));
  {
    auto r = t.allDay();
    CHECK(r.first.zone() == z && r.last.zone() == z);
    CHECK(r.contains(t));
    CHECK(!r.contains(t.tomorrow()));
  }

  auto p = t.parts();
  CHECK(p.sec == 45 && p.min == 30 && p.hour == 12);
  CHECK(p.day == 15 && p.month == 1 && p.year == 2024);
  CHECK(p.wday == 1 && p.yday == 15);
  CHECK(!p.dst && p.abbrev == "EST");

  {
    auto v = t.call("hour");
    CHECK(std::get_if<int64_t>(&v) && *std::get_if<int64_t>(&v) == 12);
  }
  {
    auto v = t.call("as_time_t");
    CHECK(std::get_if<int64_t>(&v) && *std::get_if<int64_t>(&v) == 1705339845);
  }
  {
    auto v = t.call("beginningOfDay");
    auto r = std::get_if<TzTime>(&v);
    CHECK(r && r->zone() == z);
    CHECK(r && (r->utc() == TzDateTime{2024, 1, 15, 5, 0, 0}));
  }
  {
    auto v = t.call("allMonth");
    auto r = std::get_if<TzTimeRange>(&v);
    CHECK(r && (r->first.local() == TzDateTime{2024, 1, 1}));
    CHECK(r && r->last.day() == 31 && r->last.zone() == z);
  }
  {
    std::string target;
    try {
      t.call("bogus");
    } catch (const TzTimeError::UnsupportedOperation &e) {
      target = e.target();
    }
    CHECK(target == t.inspect());
    CHECK(target.find("EST") != std::string::npos);
  }
}

void formatting()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  CHECK(t.toString() == "2024-01-15 12:30:45 -05:00");
  CHECK(t.toString("db") == "2024-01-15 17:30:45");
  CHECK(t.toString("number") == "20240115123045");
  CHECK(t.toString("short") == "15 Jan 12:30");
  CHECK(t.toString("long") == "January 15, 2024 12:30");
  CHECK(t.toString("long_ordinal") == "January 15th, 2024 12:30");
  CHECK(t.toString("rfc822") == "Mon, 15 Jan 2024 12:30:45 -0500");
  CHECK(t.toString("iso8601") == "2024-01-15T12:30:45-05:00");
  CHECK(t.toString("bogus") == t.toString());

  CHECK(t.strftime("%H:%M %Z") == "12:30 EST");
  CHECK(t.strftime("%Y-%m-%d %:z") == "2024-01-15 -05:00");
  CHECK(t.strftime("100%% %Z") == "100% EST");
  CHECK(t.inspect() == "Mon, 15 Jan 2024 12:30:45.000000000 EST -05:00");
  CHECK(t.iso8601() == "2024-01-15T12:30:45-05:00");
  CHECK(t.iso8601(3) == "2024-01-15T12:30:45.000-05:00");
  CHECK(t.xmlschema() == t.iso8601());
  CHECK(t.formattedOffset() == "-05:00");
  CHECK(t.formattedOffset(false) == "-0500");

  auto u = t.inZone("UTC");
  CHECK(u.toString() == "2024-01-15 17:30:45 UTC");
  CHECK(u.iso8601() == "2024-01-15T17:30:45Z");
  CHECK(u.formattedOffset() == "+00:00");
  CHECK(u.formattedOffset(true, "Z") == "Z");
  CHECK(u.strftime("%Z") == "UTC");

  auto i = t.inZone("+05:30");
  CHECK(i.toString() == "2024-01-15 23:00:45 +05:30");
  CHECK(i.iso8601() == "2024-01-15T23:00:45+05:30");

  auto formats = TzFormats::instance();
  formats->add("stamp", "%Y%m%d-%H%M%S %Z");
  CHECK(formats->exists("stamp"));
  CHECK(t.toString("stamp") == "20240115-123045 EST");
  formats->add("epoch", [](const TzTime &t) {
    return std::to_string(t.as_time_t());
  });
  CHECK(t.toString("epoch") == "1705339845");
  formats->del("stamp");
  CHECK(!formats->exists("stamp"));
  CHECK(t.toString("stamp") == t.toString());

  CHECK(Tz::ordinalize(1) == "1st");
  CHECK(Tz::ordinalize(2) == "2nd");
  CHECK(Tz::ordinalize(3) == "3rd");
  CHECK(Tz::ordinalize(4) == "4th");
  CHECK(Tz::ordinalize(11) == "11th");
  CHECK(Tz::ordinalize(12) == "12th");
  CHECK(Tz::ordinalize(13) == "13th");
  CHECK(Tz::ordinalize(21) == "21st");
  CHECK(Tz::ordinalize(102) == "102nd");
  CHECK(Tz::ordinalize(111) == "111th");
}

void serialization()
{
  auto z = Tz::findZone(eastern);
  auto t = TzTime::fromUTC(TzDateTime{2024, 1, 15, 17, 30, 45}, z);

  TzCf cf;
  t.encode(cf);
  CHECK(cf.get("utc") == "2024-01-15T17:30:45Z");
  CHECK(cf.get("zone") == eastern);
  CHECK(cf.get("time") == "2024-01-15T12:30:45.000000000");

  auto d = TzTime::decode(cf);
  CHECK(d.eql(t));
  CHECK(d.zone() == z);
  CHECK(d.local() == t.local());

  // round-trip through configuration text
  TzCf cf2;
  cf2.fromString(cf.toString());
  CHECK(TzTime::decode(cf2).eql(t));

  // utc is authoritative
  cf.set("time", "2024-01-15T00:00:00");
  CHECK(TzTime::decode(cf).eql(t));

  TzCf missing;
  missing.set("utc", "2024-01-15T17:30:45Z");
  CHECK(throws<TzCfError::Required>([&missing]() {
    TzTime::decode(missing);
  }));
  missing.set("zone", "No/Such_Zone");
  CHECK(throws<TzTimeError::UnknownZone>([&missing]() {
    TzTime::decode(missing);
  }));
}

int main()
{
  construction();
  sharing();
  conversion();
  arithmetic();
  comparison();
  change();
  delegation();
  formatting();
  serialization();
  return failed ? 1 : 0;
}
