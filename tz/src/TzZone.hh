//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zone - resolves periods for UTC instants and local times

#ifndef TzZone_HH
#define TzZone_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tzlib/TzDateTime.hh>
#include <tzlib/TzPeriod.hh>

namespace Tz {

// +HH:MM (colon) or +HHMM; if seconds is set, a non-zero seconds
// component is appended as :SS or SS
TzExtern std::string formatOffset(
    int offset, bool colon = true, bool seconds = false);

// +HH:MM[:SS], -HHMM, +HH, or integer seconds; returns false if invalid
TzExtern bool parseOffset(std::string_view s, int &offset);

} // Tz

class TzAPI TzZone {
  TzZone(const TzZone &) = delete;
  TzZone &operator =(const TzZone &) = delete;

protected:
  TzZone(std::string name) : m_name{std::move(name)} { }

public:
  virtual ~TzZone() { }

  const std::string &name() const { return m_name; }

  // never ambiguous
  virtual TzPeriod periodForUTC(const TzDateTime &utc) const = 0;

  // zero (gap), one, or two (fold) periods, ordered by instant
  virtual std::vector<TzPeriod> periodsForLocal(const TzDateTime &local) const;

  // first of periodsForLocal(), throws NoSuchLocalTime for a gap
  TzPeriod periodForLocal(const TzDateTime &local) const;

  TzDateTime utcToLocal(const TzDateTime &utc) const {
    return utc + periodForUTC(utc).utcOffset;
  }
  TzDateTime localToUTC(const TzDateTime &local) const {
    return local - periodForLocal(local).utcOffset;
  }

  bool equals(const TzZone &z) const { return m_name == z.m_name; }
  friend inline bool operator ==(const TzZone &l, const TzZone &r) {
    return l.equals(r);
  }

  friend std::ostream &operator <<(std::ostream &s, const TzZone &z) {
    return s << z.m_name;
  }

private:
  std::string	m_name;
};

using TzZoneRef = std::shared_ptr<const TzZone>;

// constant offset zone, named "UTC" or "+HH:MM"
class TzAPI TzFixedZone : public TzZone {
public:
  TzFixedZone(int offset);
  TzFixedZone(std::string name, int offset, std::string abbrev);

  int offset() const { return m_period.utcOffset; }

  TzPeriod periodForUTC(const TzDateTime &) const { return m_period; }
  std::vector<TzPeriod> periodsForLocal(const TzDateTime &) const {
    return {m_period};
  }

private:
  TzPeriod	m_period;
};

#endif /* TzZone_HH */
