//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// named time formats for TzTime::toString()

// TzFormats::instance()->add("stamp", "%Y%m%d-%H%M%S %Z");
// TzFormats::instance()->add("epoch", [](const TzTime &t) {
//   return std::to_string(t.as_time_t());
// });
// t.toString("stamp");
//
// built-in: number, short, long, long_ordinal, rfc822, iso8601;
// "default" and "db" are rendered by TzTime itself and cannot be replaced

#ifndef TzFormats_HH
#define TzFormats_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>

class TzTime;

namespace Tz {

// 1st, 2nd, 3rd, 4th, 11th, 12th, 13th, 21st, ...
TzExtern std::string ordinalize(int i);

} // Tz

class TzAPI TzFormats {
  TzFormats(const TzFormats &) = delete;
  TzFormats &operator =(const TzFormats &) = delete;

  TzFormats();

public:
  using Fn = std::function<std::string(const TzTime &)>;

  static TzFormats *instance();

  // strftime pattern, %Z is the zone abbreviation
  void add(std::string name, std::string pattern);
  void add(std::string name, Fn fn);
  void del(std::string_view name);

  bool exists(std::string_view name) const;

  // returns false if name is not registered
  bool render(std::string_view name, const TzTime &t, std::string &out) const;

private:
  using Format = std::variant<std::string, Fn>;
  using Map = std::map<std::string, Format, std::less<>>;

  mutable std::mutex	m_lock;
    Map			  m_formats;
};

#endif /* TzFormats_HH */
