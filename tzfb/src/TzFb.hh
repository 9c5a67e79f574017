//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// flatbuffers serialization of zoned times

// flatbuffers::FlatBufferBuilder fbb;
// fbb.Finish(TzFb::Save::zonedTime(fbb, t));
// auto t_ = TzFb::Load::zonedTime(tzfb::GetZonedTime(fbb.GetBufferPointer()));

#ifndef TzFb_HH
#define TzFb_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <stdint.h>

#include <string_view>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include <tzlib/TzDateTime.hh>
#include <tzlib/TzTime.hh>

#include <tzlib/tz_fbs.h>

namespace TzFb {

using Builder = flatbuffers::FlatBufferBuilder;
template <typename T> using Offset = flatbuffers::Offset<T>;

namespace Save {
  // inline creation of a string (shorthand alias for CreateString)
  inline auto str(Builder &fbb, std::string_view s) {
    return fbb.CreateString(s.data(), s.length());
  }

  // date/time
  inline tzfb::DateTime dateTime(const TzDateTime &v) {
    return {v.julian(), v.sec(), v.nsec()};
  }

  // [utc, zone, time]
  TzExtern Offset<tzfb::ZonedTime> zonedTime(Builder &fbb, const TzTime &v);
} // Save

namespace Load {
  // inline zero-copy conversion of a FB string to a std::string_view
  inline std::string_view str(const flatbuffers::String *s) {
    if (!s) return {};
    return {reinterpret_cast<const char *>(s->Data()), s->size()};
  }

  // date/time
  inline TzDateTime dateTime(const tzfb::DateTime *v) {
    return TzDateTime{TzDateTime::Julian{v->julian()}, v->sec(), v->nsec()};
  }
  // sec and nsec within a day / second
  inline bool normalized(const tzfb::DateTime *v) {
    return v->sec() >= 0 && v->sec() < 86400 &&
      v->nsec() >= 0 && v->nsec() < 1000000000;
  }

  // rebuilt from the UTC instant and zone name; throws BadFormat if
  // either is missing or a date/time is not normalized, UnknownZone if
  // the zone does not resolve
  TzExtern TzTime zonedTime(const tzfb::ZonedTime *v);
} // Load

// finished, size-prefix free buffer
TzExtern std::vector<uint8_t> save(const TzTime &v);
// verifies the buffer before loading, throws BadFormat
TzExtern TzTime load(const uint8_t *data, size_t length);

} // TzFb

#endif /* TzFb_HH */
