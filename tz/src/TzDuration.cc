//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// calendar duration

#include <sstream>
#include <stdexcept>

#include <tzlib/TzDuration.hh>
#include <tzlib/TzError.hh>
#include <tzlib/TzRegex.hh>

TzDuration TzDuration::seconds(int64_t n, int32_t nsec)
{
  TzDuration d;
  n += nsec / 1000000000;
  nsec %= 1000000000;
  if (nsec < 0) nsec += 1000000000, --n;
  d.m_parts[Seconds] = n;
  d.m_nsec = nsec;
  d.m_mask = 1U<<Seconds;
  return d;
}

TzDuration TzDuration::nanoseconds(int64_t n)
{
  int64_t sec = n / 1000000000;
  int64_t nsec = n % 1000000000;
  if (nsec < 0) nsec += 1000000000, --sec;
  return seconds(sec, nsec);
}

TzDuration TzDuration::operator +(const TzDuration &d) const
{
  TzDuration r;
  for (unsigned i = 0; i < NParts; i++)
    r.m_parts[i] = m_parts[i] + d.m_parts[i];
  r.m_nsec = m_nsec + d.m_nsec;
  if (r.m_nsec >= 1000000000) r.m_nsec -= 1000000000, ++r.m_parts[Seconds];
  r.m_mask = m_mask | d.m_mask;
  return r;
}

TzDuration TzDuration::operator -() const
{
  TzDuration r;
  for (unsigned i = 0; i < NParts; i++) r.m_parts[i] = -m_parts[i];
  if (m_nsec) {
    r.m_parts[Seconds] -= 1;
    r.m_nsec = 1000000000 - m_nsec;
  }
  r.m_mask = m_mask;
  return r;
}

unsigned TzDuration::scan(std::string_view s)
{
  const auto &iso = TzREGEX("\A(-)?P(?:(-?\d+)Y)?(?:(-?\d+)M)?(?:(-?\d+)W)?(?:(-?\d+)D)?(?:T(?:(-?\d+)H)?(?:(-?\d+)M)?(?:(-?\d+)(?:[.,](\d{1,9}))?S)?)?");
  TzRegex::Captures c;

  if (!iso.m(s, c)) return 0;

  // c[2] is the sign, c[3..9] the parts, c[10] the fraction
  bool negative = c[2].data() != nullptr;
  TzDuration d;
  bool time = c[1].find('T') != std::string_view::npos;
  unsigned timeParts = 0;
  for (unsigned i = 0; i < NParts; i++) {
    const auto &v = c[i + 3];
    if (!v.data()) continue;
    try {
      d.m_parts[i] = std::stoll(std::string{v});
    } catch (const std::out_of_range &) {
      return 0;
    }
    d.m_mask |= 1U<<i;
    if (i >= Hours) ++timeParts;
  }
  if (!d.m_mask || (time && !timeParts)) return 0;
  if (const auto &f = c[10]; f.data()) {
    int32_t nsec = std::stol(std::string{f});
    for (unsigned i = f.length(); i < 9; i++) nsec *= 10;
    if (d.m_parts[Seconds] < 0 || (!d.m_parts[Seconds] && c[9][0] == '-')) {
      d.m_parts[Seconds] -= 1;
      nsec = 1000000000 - nsec;
    }
    d.m_nsec = nsec;
    if (d.m_nsec == 1000000000) d.m_nsec = 0, ++d.m_parts[Seconds];
  }
  if (negative) d = -d;
  *this = d;
  return c[1].length();
}

TzDuration TzDuration::parse(std::string_view s)
{
  TzDuration d;
  if (d.scan(s) != s.length())
    throw TzTimeError::BadFormat{"ISO 8601 duration", std::string{s}};
  return d;
}

void TzDuration::print(std::ostream &s) const
{
  // a wholly negative duration is printed with a leading '-'
  bool negative = m_mask;
  for (unsigned i = 0; i < NParts; i++)
    if (specified(i) && m_parts[i] >= 0) { negative = false; break; }
  TzDuration d = negative ? -*this : *this;
  if (negative) s << '-';
  s << 'P';
  static const char units[] = "YMWDHMS";
  for (unsigned i = 0; i < Hours; i++)
    if (d.specified(i)) s << d.m_parts[i] << units[i];
  bool time = false;
  for (unsigned i = Hours; i < NParts; i++) {
    if (!d.specified(i)) continue;
    if (!time) { s << 'T'; time = true; }
    if (i == Seconds && d.m_nsec) {
      int64_t sec = d.m_parts[Seconds];
      int32_t nsec = d.m_nsec;
      if (sec < 0) { ++sec; nsec = 1000000000 - nsec; if (!sec) s << '-'; }
      char buf[10];
      unsigned n = 9;
      for (int j = 8; j >= 0; --j) { buf[j] = '0' + nsec % 10; nsec /= 10; }
      while (n > 1 && buf[n - 1] == '0') --n;
      s << sec << '.' << std::string_view{buf, n} << 'S';
    } else
      s << d.m_parts[i] << units[i];
  }
  if (!d.m_mask) s << "T0S";
}

std::string TzDuration::iso8601() const
{
  std::ostringstream s;
  print(s);
  return s.str();
}
