//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <tzlib/TzLib.hh>

#include <stdio.h>

#include <tzlib/TzFb.hh>
#include <tzlib/TzZones.hh>
#include <tzlib/TzError.hh>

static unsigned failed = 0;

#define CHECK(x) ((x) ? puts("OK  " #x) : (++failed, puts("NOK " #x)))

template <typename E, typename L> bool throws(L l)
{
  try { l(); } catch (const E &) { return true; }
  return false;
}

static const char *eastern = "EST5EDT,M3.2.0,M11.1.0";

void roundTrip()
{
  auto z = Tz::findZone(eastern);
  TzDateTime instants[] = {
    {2024, 1, 15, 17, 30, 45, 123456789},
    {2024, 3, 10, 7, 0, 0},
    {2024, 11, 3, 5, 30, 0},
    {2024, 11, 3, 6, 30, 0}
  };
  bool ok = true;
  for (const auto &instant : instants) {
    auto t = TzTime::fromUTC(instant, z);
    auto buf = TzFb::save(t);
    auto t_ = TzFb::load(buf.data(), buf.size());
    if (!t_.eql(t) || t_.zone() != z ||
	t_.local() != t.local() || t_.abbrev() != t.abbrev())
      ok = false;
  }
  CHECK(ok);

  auto i = TzTime::fromUTC(instants[0], Tz::findZone("+05:30"));
  auto buf = TzFb::save(i);
  auto i_ = TzFb::load(buf.data(), buf.size());
  CHECK(i_.eql(i));
  CHECK(i_.zone()->name() == "+05:30");
  CHECK(i_.nsec() == 123456789);
}

void fields()
{
  auto t = TzTime::fromUTC(
      TzDateTime{2024, 7, 1, 12, 0, 0}, Tz::findZone(eastern));

  TzFb::Builder fbb;
  fbb.Finish(TzFb::Save::zonedTime(fbb, t));
  auto v = tzfb::GetZonedTime(fbb.GetBufferPointer());
  CHECK(v->utc() && v->zone() && v->time());
  CHECK(TzFb::Load::str(v->zone()) == eastern);
  CHECK((TzFb::Load::dateTime(v->utc()) == TzDateTime{2024, 7, 1, 12, 0, 0}));
  CHECK((TzFb::Load::dateTime(v->time()) == TzDateTime{2024, 7, 1, 8, 0, 0}));
  CHECK(TzFb::Load::str(nullptr).empty());
}

void errors()
{
  // missing zone
  {
    TzFb::Builder fbb;
    auto utc = TzFb::Save::dateTime(TzDateTime{2024, 7, 1});
    tzfb::ZonedTimeBuilder b(fbb);
    b.add_utc(&utc);
    fbb.Finish(b.Finish());
    auto data = fbb.GetBufferPointer();
    auto size = fbb.GetSize();
    CHECK(throws<TzTimeError::BadFormat>([data, size]() {
      TzFb::load(data, size);
    }));
  }

  // unknown zone
  {
    TzFb::Builder fbb;
    auto zone = TzFb::Save::str(fbb, "No/Such_Zone");
    auto utc = TzFb::Save::dateTime(TzDateTime{2024, 7, 1});
    tzfb::ZonedTimeBuilder b(fbb);
    b.add_utc(&utc);
    b.add_zone(zone);
    fbb.Finish(b.Finish());
    auto data = fbb.GetBufferPointer();
    auto size = fbb.GetSize();
    CHECK(throws<TzTimeError::UnknownZone>([data, size]() {
      TzFb::load(data, size);
    }));
  }

  // the UTC instant is authoritative
  {
    TzFb::Builder fbb;
    auto zone = TzFb::Save::str(fbb, eastern);
    auto utc = TzFb::Save::dateTime(TzDateTime{2024, 7, 1, 12, 0, 0});
    auto time = TzFb::Save::dateTime(TzDateTime{2024, 7, 1, 0, 0, 0});
    tzfb::ZonedTimeBuilder b(fbb);
    b.add_utc(&utc);
    b.add_zone(zone);
    b.add_time(&time);
    fbb.Finish(b.Finish());
    auto t = TzFb::load(fbb.GetBufferPointer(), fbb.GetSize());
    CHECK((t.local() == TzDateTime{2024, 7, 1, 8, 0, 0}));
  }

  // verifiable, but with a denormalized instant
  {
    auto denormalized = [](tzfb::DateTime utc, tzfb::DateTime time) {
      TzFb::Builder fbb;
      auto zone = TzFb::Save::str(fbb, eastern);
      tzfb::ZonedTimeBuilder b(fbb);
      b.add_utc(&utc);
      b.add_zone(zone);
      b.add_time(&time);
      fbb.Finish(b.Finish());
      std::vector<uint8_t> buf(
	  fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize());
      return throws<TzTimeError::BadFormat>([&buf]() {
	TzFb::load(buf.data(), buf.size());
      });
    };
    auto ok = TzFb::Save::dateTime(TzDateTime{2024, 7, 1, 12, 0, 0});
    int32_t julian = ok.julian();
    CHECK(denormalized(tzfb::DateTime{julian, 86400, 0}, ok));
    CHECK(denormalized(tzfb::DateTime{julian, -1, 0}, ok));
    CHECK(denormalized(tzfb::DateTime{julian, 0, 1000000000}, ok));
    CHECK(denormalized(tzfb::DateTime{julian, 0, -1}, ok));
    CHECK(denormalized(ok, tzfb::DateTime{julian, 90000, 0}));
  }

  // truncated and corrupt buffers
  {
    auto buf = TzFb::save(TzTime::fromUTC(TzDateTime{2024, 7, 1}, Tz::utc()));
    CHECK(throws<TzTimeError::BadFormat>([&buf]() {
      TzFb::load(buf.data(), 3);
    }));
    std::vector<uint8_t> junk(buf.size(), 0xff);
    CHECK(throws<TzTimeError::BadFormat>([&junk]() {
      TzFb::load(junk.data(), junk.size());
    }));
  }
}

int main()
{
  roundTrip();
  fields();
  errors();
  return failed ? 1 : 0;
}
