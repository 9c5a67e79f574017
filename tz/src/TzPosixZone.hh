//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// in-memory resolver for POSIX TZ rule strings

// std offset [dst [offset] [,start[/time],end[/time]]]
//
// - names are 3 or more letters, or <...> quoted (e.g. <+0330>)
// - offsets are [+-]hh[:mm[:ss]], positive west of Greenwich
// - the DST offset defaults to one hour ahead of standard time
// - start and end are Jn (1-365, ignoring Feb 29th), n (0-365)
//   or Mm.w.d (week 1-5 of month m, 5 is last, day 0 is Sunday)
// - transition times default to 02:00:00 local time
// - the rule defaults to M3.2.0,M11.1.0 (US rules)

#ifndef TzPosixZone_HH
#define TzPosixZone_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <tzlib/TzZone.hh>

class TzAPI TzPosixZone : public TzZone {
public:
  // throws BadFormat
  TzPosixZone(std::string spec);

  // as above, named by name rather than the rule string
  TzPosixZone(std::string name, std::string_view spec);

  // true if s is a syntactically valid rule string
  static bool valid(std::string_view s);

  bool hasDST() const { return !m_dstName.empty(); }

  TzPeriod periodForUTC(const TzDateTime &utc) const;

private:
  TzPosixZone() : TzZone{std::string{}} { }

  struct Rule {
    enum { Julian1 = 0, Julian0, MonthWeekDay };
    int		type = MonthWeekDay;
    int		day = 0;	// Jn, n, or d (0 is Sunday)
    int		week = 0;
    int		month = 0;
    int		time = 7200;	// seconds since local midnight

    // local transition time for year
    TzDateTime local(int year) const;
  };

  struct Transition {
    TzDateTime	utc;
    bool	dst;		// transition into DST
  };

  bool parse(std::string_view s);

  TzPeriod period(bool dst) const;

  std::string	m_stdName;
  int		m_stdOffset = 0;	// seconds east of UTC
  std::string	m_dstName;
  int		m_dstOffset = 0;
  Rule		m_start;
  Rule		m_end;
};

#endif /* TzPosixZone_HH */
