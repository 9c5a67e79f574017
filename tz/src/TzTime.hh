//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// zoned time - a UTC instant and a wall-clock time paired with a zone

// TzTime is constructed from either a UTC instant or a local time; the
// other representation and the zone period are derived on construction,
// so a const value can be read concurrently. freeze() rejects any
// further in-place arithmetic.
//
// arithmetic with fixed-length durations (hours, minutes, seconds) is
// anchored to the UTC instant; calendar-variable durations (years,
// months, weeks, days) are anchored to the local time, and the current
// period is kept if it remains valid for the new local time

#ifndef TzTime_HH
#define TzTime_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <ostream>

#include <tzlib/TzDateTime.hh>
#include <tzlib/TzDuration.hh>
#include <tzlib/TzPeriod.hh>
#include <tzlib/TzZone.hh>
#include <tzlib/TzZones.hh>

class TzCf;
class TzTime;

using TzTimeRange = TzRange<TzTime>;

// to_a() equivalent
struct TzTimeParts {
  int		sec;
  int		min;
  int		hour;
  int		day;
  int		month;
  int		year;
  int		wday;		// 0 is Sunday
  int		yday;		// 1..366
  bool		dst;
  std::string	abbrev;
};

class TzAPI TzTime {
public:
  // maximum number of one hour adjustments to resolve a local time
  // that falls in a gap
  enum { GapRetries = 6 };

  TzTime() = default;

  // reinterprets the local fields of a time-like value as UTC; any
  // offset carried by the value is discarded, not converted
  template <typename T>
  static TzMatchTimeLike<T, TzTime> fromUTC(const T &v, TzZoneRef zone) {
    return fromUTC_(v.local(), std::move(zone));
  }

  // throws AmbiguousLocalTime if a gap cannot be resolved
  static TzTime fromLocal(const TzDateTime &local, TzZoneRef zone,
      const std::optional<TzPeriod> &period = std::nullopt);

  static TzTime now(TzZoneRef zone = Tz::defaultZone()) {
    return fromUTC(TzDateTime::now(), std::move(zone));
  }

  // ISO 8601; a value with an explicit offset (or Z) is an instant,
  // otherwise a local time in zone; throws BadFormat
  static TzTime parse(std::string_view s, TzZoneRef zone = Tz::defaultZone());

  // accessors

  const TzZoneRef &zone() const { return m_zone; }
  const TzDateTime &utc() const { return m_utc; }
  const TzDateTime &local() const { return m_local; }
  const TzPeriod &period() const { return m_period; }

  int utcOffset() const { return period().utcOffset; }
  const std::string &abbrev() const { return period().abbrev; }
  bool dst() const { return period().dst; }
  bool isUTC() const {
    const auto &abbrev = this->abbrev();
    return abbrev == "UTC" || abbrev == "UCT";
  }

  bool frozen() const { return m_frozen; }
  const TzTime &freeze() { m_frozen = true; return *this; }

  // same instant in another zone
  TzTime inZone(TzZoneRef zone) const;
  TzTime inZone(std::string_view zone) const {
    return inZone(Tz::findZone(zone));
  }
  // same instant at a fixed offset
  TzTime localtime(int offset) const {
    return fromUTC(utc(), Tz::findZone(offset));
  }

  // arithmetic

  TzTime operator +(const TzDuration &d) const;
  TzTime operator -(const TzDuration &d) const { return *this + -d; }
  // throws Frozen
  TzTime &operator +=(const TzDuration &d);
  TzTime &operator -=(const TzDuration &d) { return *this += -d; }

private:
  template <typename U>
  struct IsInt : public std::bool_constant<
      std::is_integral_v<U> && !std::is_same_v<U, bool> &&
      !std::is_same_v<U, char>> { };
  template <typename U, typename R = void>
  using MatchInt = TzIfT<IsInt<U>{}, R>;

public:
  // raw numeric seconds are fixed-length
  template <typename T>
  MatchInt<T, TzTime> operator +(T sec) const {
    return *this + TzDuration::seconds(sec);
  }
  template <typename T>
  MatchInt<T, TzTime> operator -(T sec) const {
    return *this + TzDuration::seconds(-int64_t(sec));
  }

  // elapsed seconds between two time-like values
  template <typename T>
  TzMatchTimeLike<T, double> operator -(const T &v) const {
    return utc() - v.utc();
  }

  TzTime since(const TzDuration &d) const { return *this + d; }
  TzTime in(const TzDuration &d) const { return *this + d; }
  TzTime ago(const TzDuration &d) const { return *this + -d; }
  TzTime advance(const TzDuration &d) const { return *this + d; }

  // throws ConflictingZoneSpec, BadField, UnknownZone
  TzTime change(const TzChange &c) const;

  // comparison is by instant

  template <typename T>
  TzMatchTimeLike<T, int> cmp(const T &v) const { return utc().cmp(v.utc()); }

  // representation-equal UTC instants
  template <typename T>
  TzMatchTimeLike<T, bool> eql(const T &v) const {
    return utc().equals(v.utc());
  }

  friend inline bool operator ==(const TzTime &l, const TzTime &r) {
    return l.eql(r);
  }
  friend inline int operator <=>(const TzTime &l, const TzTime &r) {
    return l.cmp(r);
  }
  friend inline bool operator ==(const TzTime &l, const TzDateTime &r) {
    return l.eql(r);
  }
  friend inline int operator <=>(const TzTime &l, const TzDateTime &r) {
    return l.cmp(r);
  }

  bool operator !() const { return !m_zone; }
  TzOpBool

  // delegation to the local time; time-like results are re-wrapped in
  // this zone, keeping the current period where still valid

  int year() const { return local().year(); }
  int month() const { return local().month(); }
  int day() const { return local().day(); }
  int hour() const { return local().hour(); }
  int minute() const { return local().minute(); }
  int second() const { return local().second(); }
  int nsec() const { return local().nsec(); }
  int wday() const { return local().wday(); }
  int yday() const { return local().yday(); }
  int64_t as_time_t() const { return utc().as_time_t(); }

  TzTime beginningOfDay() const { return wrap(local().beginningOfDay()); }
  TzTime middleOfDay() const { return wrap(local().middleOfDay()); }
  TzTime endOfDay() const { return wrap(local().endOfDay()); }
  TzTime beginningOfHour() const { return wrap(local().beginningOfHour()); }
  TzTime endOfHour() const { return wrap(local().endOfHour()); }
  TzTime beginningOfMinute() const {
    return wrap(local().beginningOfMinute());
  }
  TzTime endOfMinute() const { return wrap(local().endOfMinute()); }
  TzTime beginningOfMonth() const { return wrap(local().beginningOfMonth()); }
  TzTime endOfMonth() const { return wrap(local().endOfMonth()); }
  TzTime beginningOfYear() const { return wrap(local().beginningOfYear()); }
  TzTime endOfYear() const { return wrap(local().endOfYear()); }
  TzTime tomorrow() const { return wrap(local().tomorrow()); }
  TzTime yesterday() const { return wrap(local().yesterday()); }
  TzTimeRange allDay() const;
  TzTimeRange allMonth() const;
  TzTimeRange allYear() const;

  TzTimeParts parts() const;

  // name-based dispatch over the delegated operations; throws
  // UnsupportedOperation naming this value's inspect() rendering
  using Value = std::variant<int64_t, TzTime, TzTimeRange>;
  Value call(std::string_view name) const;

  // formatting

  // "default" - YYYY-MM-DD HH:MM:SS +HH:MM (or UTC)
  // "db" - YYYY-MM-DD HH:MM:SS of the UTC instant
  // any other name registered with TzFormats, unknown names are "default"
  std::string toString(std::string_view format = "default") const;

  // %Z is the zone abbreviation, other conversions are per
  // TzDateTime::strftime() at this value's UTC offset
  std::string strftime(std::string_view format) const;

  // Www, DD Mon YYYY HH:MM:SS.nnnnnnnnn ABBR +HH:MM
  std::string inspect() const;

  // YYYY-MM-DDTHH:MM:SS[.f](Z|+HH:MM)
  std::string iso8601(unsigned ndp = 0) const;
  std::string xmlschema(unsigned ndp = 0) const { return iso8601(ndp); }

  // alternateUTC (if non-null) replaces a zero offset for UTC zones
  std::string formattedOffset(
      bool colon = true, const char *alternateUTC = nullptr) const;

  friend std::ostream &operator <<(std::ostream &s, const TzTime &v) {
    return s << v.toString();
  }

  // serialization - keys utc, zone, time
  void encode(TzCf &cf) const;
  static TzTime decode(const TzCf &cf);

private:
  TzTime(TzZoneRef zone,
      const TzDateTime &utc, const TzDateTime &local, TzPeriod period) :
    m_utc{utc}, m_local{local},
    m_period{std::move(period)}, m_zone{std::move(zone)} { }

  static TzTime fromUTC_(const TzDateTime &utc, TzZoneRef zone);

  TzTime wrap(const TzDateTime &local) const {
    return fromLocal(local, m_zone, m_period);
  }

  TzDateTime	m_utc;
  TzDateTime	m_local;
  TzPeriod	m_period;
  TzZoneRef	m_zone;
  bool		m_frozen = false;
};

#endif /* TzTime_HH */
