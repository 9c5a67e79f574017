//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Olson zone resolved through the C library's tz database

#include <time.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <mutex>
#include <optional>

#include <tzlib/TzSysZone.hh>
#include <tzlib/TzError.hh>

namespace {

std::mutex &tzLock()
{
  static std::mutex lock;
  return lock;
}

class TzGuard {
public:
  TzGuard(const char *tz) : m_guard{tzLock()} {
    if (tz) {
      if (const char *oldTz = ::getenv("TZ")) m_oldTz = oldTz;
      ::setenv("TZ", tz, 1);
      m_set = true;
    }
    Tz::tzset();
  }
  ~TzGuard() {
    if (m_set) {
      if (m_oldTz)
	::setenv("TZ", m_oldTz->c_str(), 1);
      else
	::unsetenv("TZ");
      Tz::tzset();
    }
  }

private:
  std::lock_guard<std::mutex>	m_guard;
  std::optional<std::string>	m_oldTz;
  bool				m_set = false;
};

} // namespace

bool Tz::sysZoneExists(const std::string &name)
{
  if (name.empty() || name[0] == '/' ||
      name.find("..") != std::string::npos) return false;
  std::string dir;
  if (const char *tzdir = ::getenv("TZDIR"))
    dir = tzdir;
  else
    dir = "/usr/share/zoneinfo";
  std::string path = dir + '/' + name;
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

TzSysZone::TzSysZone(std::string name) : TzZone{std::move(name)}
{
  if (!Tz::sysZoneExists(this->name()))
    throw TzTimeError::UnknownZone{this->name()};
}

namespace {

// offset, DST flag and abbreviation in effect at an instant
struct State {
  long		offset = 0;
  bool		dst = false;
  std::string	abbrev;

  bool operator ==(const State &s) const {
    return offset == s.offset && dst == s.dst && abbrev == s.abbrev;
  }
};

bool state(time_t t, State &s)
{
  struct tm tm_;
  if (TzUnlikely(!localtime_r(&t, &tm_))) return false;
  s.offset = tm_.tm_gmtoff;
  s.dst = tm_.tm_isdst > 0;
  if (tm_.tm_zone) s.abbrev = tm_.tm_zone; else s.abbrev.clear();
  return true;
}

// transitions are located by stepping a week at a time up to roughly
// 400 days either side, then bisecting to the second; transitions
// less than a week apart may be coalesced
enum { TransitionStep = 7 * 86400, TransitionSteps = 58 };

// first instant with a state other than s, searching from t in
// direction dir (forward: the first differing second; backward: the
// first second of s); nullopt if none is found within range
std::optional<time_t> transition(time_t t, const State &s, int dir)
{
  State s_;
  time_t bound = t;
  unsigned i;
  for (i = 0; i < TransitionSteps; i++) {
    bound += dir * time_t(TransitionStep);
    if (!state(bound, s_)) return std::nullopt;
    if (!(s_ == s)) break;
  }
  if (i == TransitionSteps) return std::nullopt;
  time_t lo = dir > 0 ? t : bound, hi = dir > 0 ? bound : t;
  bool loSame = dir > 0;
  while (hi - lo > 1) {
    time_t mid = lo + (hi - lo) / 2;
    if (!state(mid, s_)) return std::nullopt;
    if ((s_ == s) == loSame) lo = mid; else hi = mid;
  }
  return hi;
}

} // namespace

TzPeriod TzSysZone::periodForUTC(const TzDateTime &utc) const
{
  time_t t = utc.as_time_t();
  State s;
  TzPeriod p;

  TzGuard guard(name().c_str());

  if (TzUnlikely(!state(t, s)))
    throw TzTimeError::BadFormat{"UTC instant", utc.iso_()};

  p.utcOffset = s.offset;
  p.abbrev = s.abbrev;
  p.dst = s.dst;
  if (auto start = transition(t, s, -1)) p.start = TzDateTime{*start};
  if (auto end = transition(t, s, 1)) p.end = TzDateTime{*end};
  return p;
}
