//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// zone registry - one shared zone record per name, default zone

// zone names are resolved in the following order:
// - registered aliases
// - UTC, GMT, UCT, Z
// - numeric offsets (+05:00, -0330, +05, 19800)
// - Olson names in the system tz database (America/New_York)
// - POSIX TZ rule strings (EST5EDT,M3.2.0,M11.1.0)
//
// the default zone is process-wide state, set once during startup
// (Tz::init() applies the "zone" configuration key); it is UTC until set

#ifndef TzZones_HH
#define TzZones_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include <tzlib/TzZone.hh>

class TzAPI TzZones {
  TzZones(const TzZones &) = delete;
  TzZones &operator =(const TzZones &) = delete;

  TzZones();

public:
  static TzZones *instance();

  // throws UnknownZone
  TzZoneRef find(std::string_view name);
  TzZoneRef find(int offset);

  // register alias for spec (any name accepted by find()), throws
  // UnknownZone if spec does not resolve
  void alias(std::string alias, std::string_view spec);

  TzZoneRef utc() const { return m_utc; }

  TzZoneRef defaultZone() const;
  void defaultZone(TzZoneRef zone);

private:
  TzZoneRef find_(std::string_view name, unsigned depth);

  using Map = std::map<std::string, TzZoneRef, std::less<>>;
  using Aliases = std::map<std::string, std::string, std::less<>>;

  mutable std::recursive_mutex	m_lock;
    Map				  m_zones;
    Aliases			  m_aliases;
    TzZoneRef			  m_default;
  TzZoneRef			m_utc;
};

namespace Tz {

inline TzZoneRef findZone(std::string_view name) {
  return TzZones::instance()->find(name);
}
inline TzZoneRef findZone(int offset) {
  return TzZones::instance()->find(offset);
}
inline TzZoneRef utc() { return TzZones::instance()->utc(); }

inline TzZoneRef defaultZone() { return TzZones::instance()->defaultZone(); }
inline void defaultZone(TzZoneRef zone) {
  TzZones::instance()->defaultZone(std::move(zone));
}

} // Tz

#endif /* TzZones_HH */
