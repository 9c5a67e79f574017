//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Olson zone resolved through the C library's tz database

// TzSysZone:
// - set and revert the TZ environment variable as necessary
// - acquire and release a global lock to ensure serialization
//   (tzset() is not thread-safe in any case)
// - should not be called with high frequency by high-performance
//   applications since
// - tzset() probably accesses system configuration files and/or external
//   timezone databases

#ifndef TzSysZone_HH
#define TzSysZone_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <tzlib/TzZone.hh>

namespace Tz {

// timezone manipulation
inline void tzset(void) { ::tzset(); }

// true if name is present in the system tz database
TzExtern bool sysZoneExists(const std::string &name);

} // Tz

class TzAPI TzSysZone : public TzZone {
public:
  // throws UnknownZone if name is not in the system tz database
  TzSysZone(std::string name);

  // period bounds are the neighbouring transitions within about a year,
  // unbounded where there are none
  TzPeriod periodForUTC(const TzDateTime &utc) const;
};

#endif /* TzSysZone_HH */
