//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zone - resolves periods for UTC instants and local times

#include <algorithm>

#include <tzlib/TzZone.hh>
#include <tzlib/TzError.hh>

std::string Tz::formatOffset(int offset, bool colon, bool seconds)
{
  std::string s;
  int offset_ = offset < 0 ? -offset : offset;
  int h = offset_ / 3600, m = (offset_ % 3600) / 60, sec = offset_ % 60;
  s += offset < 0 ? '-' : '+';
  s += char('0' + h / 10);
  s += char('0' + h % 10);
  if (colon) s += ':';
  s += char('0' + m / 10);
  s += char('0' + m % 10);
  if (seconds && sec) {
    if (colon) s += ':';
    s += char('0' + sec / 10);
    s += char('0' + sec % 10);
  }
  return s;
}

bool Tz::parseOffset(std::string_view s, int &offset)
{
  unsigned n = s.length();
  if (!n) return false;

  unsigned i = 0;
  int sign = 1;
  if (s[0] == '+' || s[0] == '-') { if (s[0] == '-') sign = -1; ++i; }
  if (i >= n) return false;

  auto digit = [&s](unsigned j) { return static_cast<unsigned>(s[j] - '0'); };

  for (unsigned j = i; j < n; j++) if (digit(j) >= 10) goto hhmm;

  // plain integer seconds, unsigned input only
  if (!i) {
    if (n > 5) return false;
    int v = 0;
    for (unsigned j = 0; j < n; j++) v = v * 10 + digit(j);
    if (v > 86400) return false;
    offset = v;
    return true;
  }

  // +HH or +HHMM
  if (n - i == 2 || n - i == 4) {
    int h = digit(i) * 10 + digit(i + 1), m = 0;
    if (n - i == 4) m = digit(i + 2) * 10 + digit(i + 3);
    if (h > 23 || m > 59) return false;
    offset = sign * (h * 3600 + m * 60);
    return true;
  }
  return false;

hhmm:
  // +HH:MM or +HH:MM:SS
  if (!i || (n - i != 5 && n - i != 8) || s[i + 2] != ':') return false;
  if (digit(i) >= 10 || digit(i + 1) >= 10 ||
      digit(i + 3) >= 10 || digit(i + 4) >= 10) return false;
  {
    int h = digit(i) * 10 + digit(i + 1);
    int m = digit(i + 3) * 10 + digit(i + 4);
    int sec = 0;
    if (n - i == 8) {
      if (s[i + 5] != ':' || digit(i + 6) >= 10 || digit(i + 7) >= 10)
	return false;
      sec = digit(i + 6) * 10 + digit(i + 7);
    }
    if (h > 23 || m > 59 || sec > 59) return false;
    offset = sign * (h * 3600 + m * 60 + sec);
  }
  return true;
}

void TzPeriod::print(std::ostream &s) const
{
  s << abbrev << ' ' << Tz::formatOffset(utcOffset);
  if (dst) s << " DST";
  if (start || end) {
    s << " [";
    if (start) s << start;
    s << ", ";
    if (end) s << end;
    s << ')';
  }
}

std::vector<TzPeriod> TzZone::periodsForLocal(const TzDateTime &local) const
{
  // candidate offsets are those in effect a day either side
  int offsets[2] = {
    periodForUTC(local - 86400).utcOffset,
    periodForUTC(local + 86400).utcOffset
  };

  std::vector<std::pair<TzDateTime, TzPeriod>> candidates;
  for (unsigned i = 0; i < 2; i++) {
    if (i && offsets[1] == offsets[0]) break;
    TzDateTime utc = local - offsets[i];
    TzPeriod period = periodForUTC(utc);
    if (period.utcOffset != offsets[i]) continue;
    candidates.emplace_back(utc, std::move(period));
  }
  std::sort(candidates.begin(), candidates.end(),
      [](const auto &l, const auto &r) { return l.first < r.first; });

  std::vector<TzPeriod> periods;
  periods.reserve(candidates.size());
  for (auto &candidate : candidates)
    if (std::find(periods.begin(), periods.end(), candidate.second) ==
	periods.end())
      periods.emplace_back(std::move(candidate.second));
  return periods;
}

TzPeriod TzZone::periodForLocal(const TzDateTime &local) const
{
  auto periods = periodsForLocal(local);
  if (periods.empty())
    throw TzTimeError::NoSuchLocalTime{local.strftime_("%Y-%m-%d %H:%M:%S"), m_name};
  return std::move(periods[0]);
}

TzFixedZone::TzFixedZone(int offset) :
  TzZone{offset ? Tz::formatOffset(offset, true, true) : std::string{"UTC"}}
{
  m_period.utcOffset = offset;
  m_period.abbrev = name();
}

TzFixedZone::TzFixedZone(std::string name, int offset, std::string abbrev) :
  TzZone{std::move(name)}
{
  m_period.utcOffset = offset;
  m_period.abbrev = std::move(abbrev);
}
