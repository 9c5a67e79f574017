//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// in-memory resolver for POSIX TZ rule strings

#include <algorithm>

#include <tzlib/TzPosixZone.hh>
#include <tzlib/TzError.hh>

namespace {

// recursive descent over the rule string
class Scanner {
public:
  Scanner(std::string_view s) : m_s{s} { }

  bool end() const { return m_off >= m_s.length(); }
  char peek() const { return end() ? '\0' : m_s[m_off]; }
  bool match(char c) {
    if (peek() != c) return false;
    ++m_off;
    return true;
  }

  bool name(std::string &v) {
    if (match('<')) {
      unsigned off = m_off;
      while (!end() && peek() != '>') {
	char c = peek();
	if (!isalnum(c) && c != '+' && c != '-') return false;
	++m_off;
      }
      if (m_off - off < 3 || !match('>')) return false;
      v = m_s.substr(off, m_off - off - 1);
      return true;
    }
    unsigned off = m_off;
    while (!end() && isalpha(peek())) ++m_off;
    if (m_off - off < 3) return false;
    v = m_s.substr(off, m_off - off);
    return true;
  }

  bool number(int &v, int min, int max) {
    unsigned off = m_off;
    v = 0;
    while (!end() && isdigit(peek())) {
      v = v * 10 + (peek() - '0');
      if (v > max) return false;
      ++m_off;
    }
    return m_off > off && v >= min;
  }

  // [+-]hh[:mm[:ss]]
  bool time(int &v, int maxHours) {
    int sign = 1;
    if (match('-')) sign = -1; else match('+');
    int h, m = 0, s = 0;
    if (!number(h, 0, maxHours)) return false;
    if (match(':')) {
      if (!number(m, 0, 59)) return false;
      if (match(':') && !number(s, 0, 59)) return false;
    }
    v = sign * (h * 3600 + m * 60 + s);
    return true;
  }

private:
  static bool isalpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  }
  static bool isdigit(char c) { return c >= '0' && c <= '9'; }
  static bool isalnum(char c) { return isalpha(c) || isdigit(c); }

  std::string_view	m_s;
  unsigned		m_off = 0;
};

} // namespace

TzPosixZone::TzPosixZone(std::string spec) : TzZone{spec}
{
  if (!parse(spec))
    throw TzTimeError::BadFormat{"POSIX TZ rule", std::move(spec)};
}

TzPosixZone::TzPosixZone(std::string name, std::string_view spec) :
  TzZone{std::move(name)}
{
  if (!parse(spec))
    throw TzTimeError::BadFormat{"POSIX TZ rule", std::string{spec}};
}

bool TzPosixZone::valid(std::string_view s)
{
  TzPosixZone zone;
  return zone.parse(s);
}

bool TzPosixZone::parse(std::string_view s)
{
  Scanner scan{s};

  int offset;
  if (!scan.name(m_stdName) || !scan.time(offset, 24)) return false;
  m_stdOffset = -offset;
  if (scan.end()) return true;

  if (!scan.name(m_dstName)) return false;
  m_dstOffset = m_stdOffset + 3600;
  if (!scan.end() && scan.peek() != ',') {
    if (!scan.time(offset, 24)) return false;
    m_dstOffset = -offset;
  }

  if (scan.end()) {
    // US rules
    m_start = Rule{Rule::MonthWeekDay, 0, 2, 3, 7200};
    m_end = Rule{Rule::MonthWeekDay, 0, 1, 11, 7200};
    return true;
  }

  auto rule = [&scan](Rule &r) {
    if (!scan.match(',')) return false;
    if (scan.match('J')) {
      r.type = Rule::Julian1;
      if (!scan.number(r.day, 1, 365)) return false;
    } else if (scan.match('M')) {
      r.type = Rule::MonthWeekDay;
      if (!scan.number(r.month, 1, 12) || !scan.match('.') ||
	  !scan.number(r.week, 1, 5) || !scan.match('.') ||
	  !scan.number(r.day, 0, 6)) return false;
    } else {
      r.type = Rule::Julian0;
      if (!scan.number(r.day, 0, 365)) return false;
    }
    r.time = 7200;
    if (scan.match('/') && !scan.time(r.time, 167)) return false;
    return true;
  };

  return rule(m_start) && rule(m_end) && scan.end();
}

TzDateTime TzPosixZone::Rule::local(int year) const
{
  int julian;
  switch (type) {
    case Julian1: {
      julian = TzDateTime::julian(year, 1, 1) + day - 1;
      // Feb 29th is never counted
      if (day >= 60 && TzDateTime::daysInMonth(year, 2) == 29) ++julian;
    } break;
    case Julian0:
      julian = TzDateTime::julian(year, 1, 1) + day;
      break;
    default: {
      int first = TzDateTime::julian(year, month, 1);
      int n = TzDateTime::daysInMonth(year, month);
      int wday = (first + 1) % 7; // 0 is Sunday
      julian = first + (day - wday + 7) % 7 + (week - 1) * 7;
      while (julian >= first + n) julian -= 7;
    } break;
  }
  return TzDateTime{TzDateTime::Julian{julian}, 0, 0} + time;
}

TzPeriod TzPosixZone::period(bool dst) const
{
  TzPeriod p;
  if (dst) {
    p.utcOffset = m_dstOffset;
    p.abbrev = m_dstName;
    p.dst = true;
  } else {
    p.utcOffset = m_stdOffset;
    p.abbrev = m_stdName;
  }
  return p;
}

TzPeriod TzPosixZone::periodForUTC(const TzDateTime &utc) const
{
  if (!hasDST()) return period(false);

  // transitions for the adjacent years bracket any instant in this year
  Transition transitions[6];
  unsigned n = 0;
  int year = utc.year();
  for (int y = year - 1; y <= year + 1; y++) {
    // local wall-clock time before each transition determines its instant
    transitions[n++] = Transition{m_start.local(y) - m_stdOffset, true};
    transitions[n++] = Transition{m_end.local(y) - m_dstOffset, false};
  }
  std::sort(&transitions[0], &transitions[n],
      [](const Transition &l, const Transition &r) { return l.utc < r.utc; });

  unsigned i = 0;
  while (i < n && !(utc < transitions[i].utc)) ++i;
  // transitions[i - 1] <= utc < transitions[i]
  bool dst = i ? transitions[i - 1].dst : !transitions[0].dst;
  TzPeriod p = period(dst);
  if (i) p.start = transitions[i - 1].utc;
  if (i < n) p.end = transitions[i].utc;
  return p;
}
