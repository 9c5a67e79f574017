//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// calendar duration - years, months, weeks, days, hours, minutes, seconds

// a duration records which parts were specified; years, months, weeks
// and days are calendar-variable (anchored to wall-clock time), hours,
// minutes and seconds are fixed-length (anchored to the UTC instant)

#ifndef TzDuration_HH
#define TzDuration_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <string>
#include <string_view>
#include <ostream>

class TzAPI TzDuration {
public:
  enum { Years = 0, Months, Weeks, Days, Hours, Minutes, Seconds, NParts };

  TzDuration() = default;

  static TzDuration years(int64_t n) { return part(Years, n); }
  static TzDuration months(int64_t n) { return part(Months, n); }
  static TzDuration weeks(int64_t n) { return part(Weeks, n); }
  static TzDuration days(int64_t n) { return part(Days, n); }
  static TzDuration hours(int64_t n) { return part(Hours, n); }
  static TzDuration minutes(int64_t n) { return part(Minutes, n); }
  static TzDuration seconds(int64_t n, int32_t nsec = 0);
  static TzDuration nanoseconds(int64_t n);

  int64_t get(unsigned i) const { return m_parts[i]; }
  // always 0..999999999, added to seconds
  int32_t nsec() const { return m_nsec; }

  bool specified(unsigned i) const { return m_mask & (1U<<i); }

  bool variable() const {
    return m_mask & ((1U<<Years) | (1U<<Months) | (1U<<Weeks) | (1U<<Days));
  }

  // fixed-length part, in whole seconds (excluding nsec())
  int64_t fixedSeconds() const {
    return m_parts[Hours] * 3600 + m_parts[Minutes] * 60 + m_parts[Seconds];
  }

  TzDuration operator +(const TzDuration &d) const;
  TzDuration operator -() const;
  TzDuration operator -(const TzDuration &d) const { return *this + -d; }
  TzDuration &operator +=(const TzDuration &d) { return *this = *this + d; }
  TzDuration &operator -=(const TzDuration &d) { return *this = *this - d; }

  bool equals(const TzDuration &d) const {
    for (unsigned i = 0; i < NParts; i++)
      if (m_parts[i] != d.m_parts[i]) return false;
    return m_nsec == d.m_nsec && m_mask == d.m_mask;
  }
  friend inline bool operator ==(const TzDuration &l, const TzDuration &r) {
    return l.equals(r);
  }

  bool operator !() const { return !m_mask; }
  TzOpBool

  // ISO 8601 duration, e.g. P1Y2M3W4DT5H6M7.5S, -P1D, P-1DT2H
  unsigned scan(std::string_view s);
  static TzDuration parse(std::string_view s); // throws BadFormat

  void print(std::ostream &s) const;
  std::string iso8601() const;
  friend std::ostream &operator <<(std::ostream &s, const TzDuration &d) {
    d.print(s);
    return s;
  }

private:
  static TzDuration part(unsigned i, int64_t n) {
    TzDuration d;
    d.m_parts[i] = n;
    d.m_mask = 1U<<i;
    return d;
  }

  int64_t	m_parts[NParts] = { 0 };
  int32_t	m_nsec = 0;
  uint8_t	m_mask = 0;
};

#endif /* TzDuration_HH */
