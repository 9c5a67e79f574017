//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// zone period - offset, abbreviation and DST flag for a UTC range

#ifndef TzPeriod_HH
#define TzPeriod_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <string>
#include <ostream>

#include <tzlib/TzDateTime.hh>

struct TzPeriod {
  int		utcOffset = 0;	// seconds east of UTC
  std::string	abbrev;
  bool		dst = false;
  TzDateTime	start;		// UTC, inclusive; null if unbounded
  TzDateTime	end;		// UTC, exclusive; null if unbounded

  bool contains(const TzDateTime &utc) const {
    return (!start || !(utc < start)) && (!end || utc < end);
  }

  bool equals(const TzPeriod &p) const {
    return utcOffset == p.utcOffset && dst == p.dst &&
      abbrev == p.abbrev && start == p.start && end == p.end;
  }
  friend inline bool operator ==(const TzPeriod &l, const TzPeriod &r) {
    return l.equals(r);
  }

  void print(std::ostream &s) const;
  friend std::ostream &operator <<(std::ostream &s, const TzPeriod &p) {
    p.print(s);
    return s;
  }
};

#endif /* TzPeriod_HH */
