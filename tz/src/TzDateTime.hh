//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Julian date based date/time class

// the same value type carries either a UTC instant or wall-clock fields;
// TzTime pairs one of each with a zone
//
// - julian day number (days since 1st January 4713 BC)
// - intraday time in seconds since midnight
// - nanoseconds
//
// dates prior to the Gregorian reformation (14th September 1752 by
// default) are Julian calendar dates

#ifndef TzDateTime_HH
#define TzDateTime_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <time.h>

#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <ostream>
#include <type_traits>

#include <tzlib/TzDuration.hh>

class TzDateTime;

// sparse field overrides for change(); setting hour resets
// minute/second/nsec, setting minute resets second/nsec, etc.
class TzChange {
public:
  TzChange &year(int v) { m_year = v; return *this; }
  TzChange &month(int v) { m_month = v; return *this; }
  TzChange &day(int v) { m_day = v; return *this; }
  TzChange &hour(int v) { m_hour = v; return *this; }
  TzChange &minute(int v) { m_minute = v; return *this; }
  TzChange &second(int v) { m_second = v; return *this; }
  TzChange &nsec(int v) { m_nsec = v; return *this; }
  // zone and offset are only meaningful to TzTime::change()
  TzChange &zone(std::string v) { m_zone = std::move(v); return *this; }
  TzChange &offset(std::string v) { m_offset = std::move(v); return *this; }

  const std::optional<int> &year() const { return m_year; }
  const std::optional<int> &month() const { return m_month; }
  const std::optional<int> &day() const { return m_day; }
  const std::optional<int> &hour() const { return m_hour; }
  const std::optional<int> &minute() const { return m_minute; }
  const std::optional<int> &second() const { return m_second; }
  const std::optional<int> &nsec() const { return m_nsec; }
  const std::optional<std::string> &zone() const { return m_zone; }
  const std::optional<std::string> &offset() const { return m_offset; }

private:
  std::optional<int>		m_year;
  std::optional<int>		m_month;
  std::optional<int>		m_day;
  std::optional<int>		m_hour;
  std::optional<int>		m_minute;
  std::optional<int>		m_second;
  std::optional<int>		m_nsec;
  std::optional<std::string>	m_zone;
  std::optional<std::string>	m_offset;
};

// inclusive range of date/times, e.g. allDay()
template <typename T> struct TzRange {
  T	first;
  T	last;

  bool contains(const T &v) const { return !(v < first) && !(last < v); }

  friend std::ostream &operator <<(std::ostream &s, const TzRange &r) {
    return s << r.first << ".." << r.last;
  }
};

// strftime() printer
struct TzDateTimePrintStrftime {
  const TzDateTime	&value;
  const char		*format;
  int			tzOffset;

  void print(std::ostream &s) const;
  friend std::ostream &operator <<(
      std::ostream &s, const TzDateTimePrintStrftime &p) {
    p.print(s);
    return s;
  }
};

// ISO 8601 printer; fraction digits ndp < 0 prints as many as needed
struct TzDateTimePrintISO {
  const TzDateTime	&value;
  int			tzOffset;
  int			ndp;
  bool			zulu;		// print Z for zero offset

  void print(std::ostream &s) const;
  friend std::ostream &operator <<(
      std::ostream &s, const TzDateTimePrintISO &p) {
    p.print(s);
    return s;
  }
};

class TzAPI TzDateTime {
public:
  struct Julian { int32_t v; };

  TzDateTime() = default;

  // integral / time_t
private:
  template <typename U>
  struct IsInt : public std::bool_constant<
      std::is_integral_v<U> && !std::is_same_v<U, bool> &&
      !std::is_same_v<U, char>> { };
  template <typename U, typename R = void>
  using MatchInt = TzIfT<IsInt<U>{}, R>;

public:
  template <typename T, typename = MatchInt<T>>
  explicit TzDateTime(T v) { init(v); }

  // struct tm
  TzDateTime(const struct tm *tm_) {
    ctor(tm_->tm_year + 1900, tm_->tm_mon + 1, tm_->tm_mday,
	tm_->tm_hour, tm_->tm_min, tm_->tm_sec, 0);
  }

  // multiple parameter constructors
  explicit TzDateTime(Julian julian, int sec, int nsec) :
    m_julian(julian.v), m_sec(sec), m_nsec(nsec) { }

  TzDateTime(int year, int month, int day) { ctor(year, month, day); }
  TzDateTime(int year, int month, int day,
      int hour, int minute, int sec, int nsec = 0) {
    ctor(year, month, day, hour, minute, sec, nsec);
  }

  // ISO 8601 - null if invalid
  explicit TzDateTime(std::string_view s) { scan(s); }

  // ISO 8601 - throws BadFormat if invalid
  static TzDateTime parse(std::string_view s,
      bool *explicitOffset = nullptr);

  static TzDateTime now();

  // accessors

  int32_t julian() const { return m_julian; }
  int32_t sec() const { return m_sec; }
  int32_t nsec() const { return m_nsec; }

  // time-like interface, shared with TzTime
  const TzDateTime &utc() const { return *this; }
  const TzDateTime &local() const { return *this; }
  int utcOffset() const { return 0; }

  // as_time_t() is null (INT64_MIN) for a null value
  int64_t as_time_t() const {
    if (TzUnlikely(!*this)) return INT64_MIN;
    return (int64_t(m_julian) - 2440588) * 86400 + m_sec;
  }

  struct tm *tm(struct tm *tm) const;

  void ymd(int &year, int &month, int &day) const;
  void hms(int &hour, int &minute, int &sec) const;
  void hmsn(int &hour, int &minute, int &sec, int &nsec) const;

  int year() const { int y, m, d; ymd(y, m, d); return y; }
  int month() const { int y, m, d; ymd(y, m, d); return m; }
  int day() const { int y, m, d; ymd(y, m, d); return d; }
  int hour() const { return m_sec / 3600; }
  int minute() const { return (m_sec % 3600) / 60; }
  int second() const { return m_sec % 60; }

  // 0 is Sunday
  int wday() const {
    int i = (m_julian + 1) % 7;
    return i < 0 ? i + 7 : i;
  }
  // 1..366
  int yday() const { return days(year(), 1, 1) + 1; }

  int days(int year, int month, int day) const {
    return m_julian - julian(year, month, day);
  }
  // days arg below should be the value of days(year, 1, 1)
  void ywd(int days, int &week, int &wkDay) const;
  void ywdSun(int days, int &week, int &wkDay) const;
  void ywdISO(int year, int days, int &wkYear, int &week, int &wkDay) const;

  static std::string_view dayShortName(int i); // 1 = Monday
  static std::string_view dayLongName(int i);
  static std::string_view monthShortName(int i); // 1 = January
  static std::string_view monthLongName(int i);

  static int daysInMonth(int year, int month);

  // calendar

  // years and months first (clamping the day), then weeks and days,
  // then hours, minutes and seconds as elapsed time
  TzDateTime advance(const TzDuration &d) const;

  TzDateTime change(const TzChange &c) const;

  TzDateTime beginningOfDay() const {
    return TzDateTime{Julian{m_julian}, 0, 0};
  }
  TzDateTime middleOfDay() const {
    return TzDateTime{Julian{m_julian}, 43200, 0};
  }
  TzDateTime endOfDay() const {
    return TzDateTime{Julian{m_julian}, 86399, 999999999};
  }
  TzDateTime beginningOfHour() const {
    return TzDateTime{Julian{m_julian}, m_sec - m_sec % 3600, 0};
  }
  TzDateTime endOfHour() const {
    return TzDateTime{Julian{m_julian}, m_sec - m_sec % 3600 + 3599, 999999999};
  }
  TzDateTime beginningOfMinute() const {
    return TzDateTime{Julian{m_julian}, m_sec - m_sec % 60, 0};
  }
  TzDateTime endOfMinute() const {
    return TzDateTime{Julian{m_julian}, m_sec - m_sec % 60 + 59, 999999999};
  }
  TzDateTime beginningOfMonth() const;
  TzDateTime endOfMonth() const;
  TzDateTime beginningOfYear() const;
  TzDateTime endOfYear() const;
  TzDateTime tomorrow() const { return advance(TzDuration::days(1)); }
  TzDateTime yesterday() const { return advance(TzDuration::days(-1)); }

  TzRange<TzDateTime> allDay() const { return {beginningOfDay(), endOfDay()}; }
  TzRange<TzDateTime> allMonth() const {
    return {beginningOfMonth(), endOfMonth()};
  }
  TzRange<TzDateTime> allYear() const {
    return {beginningOfYear(), endOfYear()};
  }

  // name-based dispatch over the operations above
  using Value = std::variant<int64_t, TzDateTime, TzRange<TzDateTime>>;
  Value call(std::string_view name) const;

  // printing

  // this strftime(3) is neither system timezone- nor locale- dependent;
  // timezone is specified by the (optional) tzOffset parameter, output is
  // equivalent to the C library strftime under the 'C' locale; it does
  // not call tzset() and is thread-safe; conforms to, variously:
  //   (C90) - ANSI C '90
  //   (C99) - ANSI C '99
  //   (SU) - Single Unix Specification
  //   (GNU) - glibc (not all glibc-specific extensions are supported)
  //   (TZ) - Arthur Olson's timezone library
  // the following conversion specifiers are supported:
  //   %E (SU) alt. format
  //   %O (SU) alt. digits (has no effect)
  //   %- (GNU) do not pad numeric fields
  //   %0-9 (GNU) field width (precision) specifier
  //   %a (C90) day of week - short name
  //   %A (C90) day of week - long name
  //   %b (C90) month - short name
  //   %h (SU) ''
  //   %B (C90) month - long name
  //   %c (C90) Unix asctime() / ctime() (%a %b %e %T %Y)
  //   %C (SU) century
  //   %d (C90) day of month
  //   %x (C90) %m/%d/%y
  //   %D (SU) ''
  //   %e (SU) day of month - space padded
  //   %F (C99) %Y-%m-%d per ISO 8601
  //   %g (TZ) ISO week date year (2 digits)
  //   %G (TZ) '' (4 digits)
  //   %H (C90) hour (24hr)
  //   %I (C90) hour (12hr)
  //   %j (C90) day of year
  //   %k (GNU) hour (24hr) - space padded
  //   %l (GNU) hour (12hr) - space padded
  //   %L millisecond (3 digits)
  //   %m (C90) month
  //   %M (C90) minute
  //   %n (SU) newline
  //   %N nanosecond (9 digits, or as many as the field width)
  //   %p (C90) AM/PM
  //   %P (GNU) am/pm
  //   %r (SU) %I:%M:%S %p
  //   %R (SU) %H:%M
  //   %s (TZ) number of seconds since the Epoch
  //   %S (C90) second
  //   %t (SU) TAB
  //   %X (C90) %H:%M:%S
  //   %T (SU) ''
  //   %u (SU) week day as decimal (1-7), 1 is Monday (7 is Sunday)
  //   %U (C90) week (00-53), 1st Sunday in year is 1st day of week 1
  //   %V (SU) week (01-53), per ISO week date
  //   %w (C90) week day as decimal (0-6), 0 is Sunday
  //   %W (C90) week (00-53), 1st Monday in year is 1st day of week 1
  //   %y (C90) year (2 digits)
  //   %Y (C90) year (4 digits)
  //   %z (GNU) RFC 822 timezone offset
  //   %:z (GNU) timezone offset as +hh:mm
  //   %Z (C90) timezone (UTC, or the numeric offset)
  //   %% (C90) percent sign
  auto strftime(const char *format, int tzOffset = 0) const {
    return TzDateTimePrintStrftime{*this, format, tzOffset};
  }
  std::string strftime_(const char *format, int tzOffset = 0) const;

  auto iso(int tzOffset = 0, int ndp = -1, bool zulu = true) const {
    return TzDateTimePrintISO{*this, tzOffset, ndp, zulu};
  }
  std::string iso_(int tzOffset = 0, int ndp = -1, bool zulu = true) const;

  // default printing (ISO 8601, UTC)
  friend std::ostream &operator <<(std::ostream &s, const TzDateTime &v) {
    return s << v.iso();
  }

  // parsing

  // ISO 8601, returns number of bytes consumed, 0 if invalid;
  // an explicit offset (or Z) converts to UTC and sets *explicitOffset,
  // otherwise tzOffset is subtracted
  unsigned scan(std::string_view s, int tzOffset = 0,
      bool *explicitOffset = nullptr);

  // operators

  void null() {
    m_julian = INT32_MIN;
    m_sec = 0;
    m_nsec = 0;
  }

  // elapsed time in seconds
  double operator -(const TzDateTime &v) const {
    int64_t day = int64_t(m_julian) - v.m_julian;
    int64_t sec = int64_t(m_sec) - v.m_sec;
    int64_t nsec = int64_t(m_nsec) - v.m_nsec;
    return double(day * 86400 + sec) + double(nsec) / 1000000000.0;
  }

  TzDateTime add(int64_t sec, int32_t nsec = 0) const;

  template <typename T>
  MatchInt<T, TzDateTime> operator +(T sec) const { return add(sec); }
  template <typename T>
  MatchInt<T, TzDateTime> operator -(T sec) const { return add(-int64_t(sec)); }
  template <typename T>
  MatchInt<T, TzDateTime &> operator +=(T sec) { return *this = add(sec); }
  template <typename T>
  MatchInt<T, TzDateTime &> operator -=(T sec) {
    return *this = add(-int64_t(sec));
  }

  TzDateTime operator +(const TzDuration &d) const { return advance(d); }
  TzDateTime operator -(const TzDuration &d) const { return advance(-d); }

  bool equals(const TzDateTime &v) const {
    return m_julian == v.m_julian && m_sec == v.m_sec && m_nsec == v.m_nsec;
  }
  int cmp(const TzDateTime &v) const {
    if (m_julian != v.m_julian) return m_julian < v.m_julian ? -1 : 1;
    if (m_sec != v.m_sec) return m_sec < v.m_sec ? -1 : 1;
    if (m_nsec != v.m_nsec) return m_nsec < v.m_nsec ? -1 : 1;
    return 0;
  }
  friend inline bool operator ==(const TzDateTime &l, const TzDateTime &r) {
    return l.equals(r);
  }
  friend inline int operator <=>(const TzDateTime &l, const TzDateTime &r) {
    return l.cmp(r);
  }

  bool operator !() const { return m_julian == INT32_MIN; }
  TzOpBool

  uint32_t hash() const { return m_julian ^ m_sec ^ m_nsec; }

  static void reformation(int year, int month, int day);

  static void normalize(int &year, int &month);
  static void normalize(int &day, int &hour, int &minute, int &sec, int &nsec);

  static int julian(int year, int month, int day);

  static int second(int hour, int minute, int second) {
    return hour * 3600 + minute * 60 + second;
  }

private:
  void ctor(int year, int month, int day) {
    normalize(year, month);
    m_julian = julian(year, month, day);
    m_sec = 0, m_nsec = 0;
  }
  void ctor(
    int year, int month, int day, int hour, int minute, int sec, int nsec)
  {
    normalize(year, month);
    normalize(day, hour, minute, sec, nsec);
    m_julian = julian(year, month, day);
    m_sec = second(hour, minute, sec);
    m_nsec = nsec;
  }

  void init(int64_t t) {
    if (TzLikely(t >= 0)) {
      int64_t j = t / 86400 + 2440588;
      if (j > INT32_MAX) goto overflow;
      m_julian = j;
      m_sec = t % 86400;
    } else {
      int64_t j = (t - 86399) / 86400 + 2440588;
      if (j <= INT32_MIN) goto overflow;
      m_julian = j;
      m_sec = t - (j - 2440588) * 86400;
    }
    m_nsec = 0;
    return;
  overflow:
    null();
  }

  int32_t	m_julian = INT32_MIN;	// julian day
  int32_t	m_sec = 0;	// time within day, in seconds, from midnight
  int32_t	m_nsec = 0;	// nanoseconds

// effective date of the reformation (default 14th September 1752)

  static int		m_reformationJulian;
  static int		m_reformationYear;
  static int		m_reformationMonth;
  static int		m_reformationDay;
};

// time-like trait - TzDateTime and TzTime expose utc(), local() and
// utcOffset(), and can be used interchangeably by generic code
template <typename T, typename = void>
struct TzIsTimeLike : public std::false_type { };
template <typename T>
struct TzIsTimeLike<T, std::void_t<
    decltype(std::declval<const T &>().utc().julian()),
    decltype(std::declval<const T &>().utcOffset())>> :
  public std::true_type { };
template <typename T, typename R = void>
using TzMatchTimeLike = TzIfT<TzIsTimeLike<std::decay_t<T>>{}, R>;

#endif /* TzDateTime_HH */
