//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// flatbuffers serialization of zoned times

#include <tzlib/TzFb.hh>
#include <tzlib/TzError.hh>
#include <tzlib/TzLog.hh>

namespace TzFb {

Offset<tzfb::ZonedTime> Save::zonedTime(Builder &fbb, const TzTime &v)
{
  auto zone = str(fbb, v.zone() ? std::string_view{v.zone()->name()} : "");
  auto utc = dateTime(v.utc());
  auto time = dateTime(v.local());
  tzfb::ZonedTimeBuilder b(fbb);
  b.add_utc(&utc);
  b.add_zone(zone);
  b.add_time(&time);
  return b.Finish();
}

TzTime Load::zonedTime(const tzfb::ZonedTime *v)
{
  if (TzUnlikely(!v || !v->utc() || !v->zone()))
    throw TzTimeError::BadFormat{"serialized zoned time", "incomplete"};
  if (TzUnlikely(!normalized(v->utc()) ||
	(v->time() && !normalized(v->time()))))
    throw TzTimeError::BadFormat{"serialized zoned time", "denormalized"};
  auto t = TzTime::fromUTC(dateTime(v->utc()), Tz::findZone(str(v->zone())));
  if (auto time = v->time()) {
    auto local = dateTime(time);
    if (local != t.local())
      TzLOG(Warning, ([&](auto &s) {
	s << "decoded local time " << local.iso()
	  << " disagrees with " << t.inspect();
      }));
  }
  return t;
}

std::vector<uint8_t> save(const TzTime &v)
{
  Builder fbb;
  fbb.Finish(Save::zonedTime(fbb, v));
  auto data = fbb.GetBufferPointer();
  return std::vector<uint8_t>(data, data + fbb.GetSize());
}

TzTime load(const uint8_t *data, size_t length)
{
  flatbuffers::Verifier verifier{data, length};
  if (!tzfb::VerifyZonedTimeBuffer(verifier))
    throw TzTimeError::BadFormat{"serialized zoned time",
      std::to_string(length) + " bytes"};
  return Load::zonedTime(tzfb::GetZonedTime(data));
}

} // TzFb
