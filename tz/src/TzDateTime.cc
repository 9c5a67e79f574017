//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Julian date based date/time class

#include <string.h>

#include <sstream>

#include <tzlib/TzDateTime.hh>
#include <tzlib/TzError.hh>

int TzDateTime::m_reformationYear = 1752;
int TzDateTime::m_reformationMonth = 9;
int TzDateTime::m_reformationDay = 14;
int TzDateTime::m_reformationJulian = 2361222;

namespace {

// floor division / modulus
inline int64_t fdiv(int64_t v, int64_t d) {
  int64_t q = v / d;
  if ((v % d) && ((v < 0) != (d < 0))) --q;
  return q;
}
inline int64_t fmod_(int64_t v, int64_t d) { return v - fdiv(v, d) * d; }

// print a numeric field; width 0 suppresses padding
void field(std::ostream &s, int64_t v, unsigned width, char pad = '0')
{
  char buf[24];
  unsigned n = 0;
  bool negative = v < 0;
  uint64_t u = negative ? -uint64_t(v) : uint64_t(v);
  do { buf[n++] = '0' + u % 10; u /= 10; } while (u);
  if (negative) {
    if (pad == '0') {
      s << '-';
      if (width) --width;
    } else
      buf[n++] = '-';
  }
  while (n < width) { s << pad; --width; }
  while (n) s << buf[--n];
}

// print the leading ndp digits of nanoseconds
void frac(std::ostream &s, int32_t nsec, unsigned ndp)
{
  char buf[9];
  for (int i = 8; i >= 0; --i) { buf[i] = '0' + nsec % 10; nsec /= 10; }
  for (unsigned i = 0; i < ndp; i++) s << (i < 9 ? buf[i] : '0');
}

void offset(std::ostream &s, int tzOffset, bool colon)
{
  int offset_ = tzOffset < 0 ? -tzOffset : tzOffset;
  s << (tzOffset < 0 ? '-' : '+');
  field(s, offset_ / 3600, 2);
  if (colon) s << ':';
  field(s, (offset_ % 3600) / 60, 2);
}

} // namespace

void TzDateTime::reformation(int year, int month, int day)
{
  m_reformationJulian = 0;

  m_reformationYear = 0, m_reformationMonth = 0, m_reformationDay = 0;

  TzDateTime r(year, month, day);

  m_reformationJulian = r.m_julian;

  r.ymd(m_reformationYear, m_reformationMonth, m_reformationDay);
}

TzDateTime TzDateTime::now()
{
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  TzDateTime v{int64_t(ts.tv_sec)};
  v.m_nsec = ts.tv_nsec;
  return v;
}

struct tm *TzDateTime::tm(struct tm *tm_) const
{
  memset(tm_, 0, sizeof(struct tm));

  ymd(tm_->tm_year, tm_->tm_mon, tm_->tm_mday);
  tm_->tm_year -= 1900, tm_->tm_mon--;
  hms(tm_->tm_hour, tm_->tm_min, tm_->tm_sec);
  tm_->tm_wday = wday();
  tm_->tm_yday = yday() - 1;

  return tm_;
}

void TzDateTime::ymd(int &year, int &month, int &day) const
{
  if (TzLikely(m_julian >= m_reformationJulian)) {
    int i, j, l, n;

    l = m_julian + 68569;
    n = (l<<2) / 146097;
    l = l - ((146097 * n + 3)>>2);
    i = (4000 * (l + 1)) / 1461001;
    l = l - ((1461 * i)>>2) + 31;
    j = (80 * l) / 2447;
    day = l - (2447 * j) / 80;
    l = j / 11;
    month = j + 2 - 12 * l;
    year = (100 * (n - 49) + i + l);
  } else {
    int i, j, k, l, n;

    j = m_julian + 1402;
    k = (j - 1) / 1461;
    l = j - 1461 * k;
    n = (l - 1) / 365 - l / 1461;
    i = l - 365 * n + 30;
    j = (80 * i) / 2447;
    day = i - (2447 * j) / 80;
    i = j / 11;
    month = j + 2 - 12 * i;
    year = (k<<2) + n + i - 4716;
  }
}

void TzDateTime::hms(int &hour, int &minute, int &sec) const
{
  int sec_ = m_sec;

  hour = sec_ / 3600, sec_ %= 3600,
  minute = sec_ / 60, sec = sec_ % 60;
}

void TzDateTime::hmsn(int &hour, int &minute, int &sec, int &nsec) const
{
  hms(hour, minute, sec);
  nsec = m_nsec;
}

// week (0-53) wkDay (1-7)
// 1st Monday in year is 1st day of week 1
void TzDateTime::ywd(int days, int &week, int &wkDay) const
{
  int wkDay_ = m_julian % 7;
  if (wkDay_ < 0) wkDay_ += 7;
  wkDay = wkDay_ + 1;
  week = (days + 7 - wkDay_) / 7;
}

// week (0-53) wkDay (1-7)
// 1st Sunday in year is 1st day of week 1
void TzDateTime::ywdSun(int days, int &week, int &wkDay) const
{
  int wkDay_ = (m_julian + 1) % 7;
  if (wkDay_ < 0) wkDay_ += 7;
  wkDay = wkDay_ + 1;
  week = (days + 7 - wkDay_) / 7;
}

// week (1-53) wkDay (1-7)
// 1st Thursday in year is 4th day of week 1
void TzDateTime::ywdISO(
    int year, int days, int &wkYear, int &week, int &wkDay) const
{
  int wkDay_ = m_julian % 7;
  if (wkDay_ < 0) wkDay_ += 7;
  wkDay = wkDay_ + 1;
  // Monday of the week containing this day, relative to 1st January
  int week_ = (days - wkDay_ + 10) / 7;
  if (week_ < 1) {
    TzDateTime dec31{Julian{m_julian - days - 1}, 0, 0};
    int py, pm, pd;
    dec31.ymd(py, pm, pd);
    int wkYear_, wkDay__;
    dec31.ywdISO(py, dec31.days(py, 1, 1), wkYear_, week_, wkDay__);
    wkYear = wkYear_;
    week = week_;
    return;
  }
  int daysInYear = julian(year + 1, 1, 1) - julian(year, 1, 1);
  if (week_ == 53 && (days - wkDay_ + 3) >= daysInYear) {
    wkYear = year + 1;
    week = 1;
    return;
  }
  wkYear = year;
  week = week_;
}

std::string_view TzDateTime::dayShortName(int i)
{
  static const char *s[] =
    { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
  if (--i < 0 || i >= 7) return "???";
  return s[i];
}

std::string_view TzDateTime::dayLongName(int i)
{
  static const char *s[] =
    { "Monday", "Tuesday", "Wednesday", "Thursday",
      "Friday", "Saturday", "Sunday" };
  if (--i < 0 || i >= 7) return "???";
  return s[i];
}

std::string_view TzDateTime::monthShortName(int i)
{
  static const char *s[] =
    { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep",
      "Oct", "Nov", "Dec" };
  if (--i < 0 || i >= 12) return "???";
  return s[i];
}

std::string_view TzDateTime::monthLongName(int i)
{
  static const char *s[] =
    { "January", "February", "March", "April", "May", "June", "July",
      "August", "September", "October", "November", "December" };
  if (--i < 0 || i >= 12) return "???";
  return s[i];
}

int TzDateTime::julian(int year, int month, int day)
{
  if (year > m_reformationYear ||
      (year == m_reformationYear &&
	(month > m_reformationMonth ||
	  (month == m_reformationMonth && day >= m_reformationDay)))) {
    int o = (month <= 2 ? -1 : 0);

    return ((1461 * (year + 4800 + o))>>2) +
      (367 * (month - 2 - 12 * o)) / 12 -
      ((3 * ((year + 4900 + o) / 100))>>2) +
      day - 32075;
  } else {
    return 367 * year - ((7 * (year + 5001 + (month - 9) / 7))>>2) +
      (275 * month) / 9 + day + 1729777;
  }
}

int TzDateTime::daysInMonth(int year, int month)
{
  normalize(year, month);
  int nextYear = year, nextMonth = month + 1;
  normalize(nextYear, nextMonth);
  return julian(nextYear, nextMonth, 1) - julian(year, month, 1);
}

void TzDateTime::normalize(int &year, int &month)
{
  if (month < 1) {
    year -= (12 - month) / 12;
    month = 12 - ((12 - month) % 12);
    return;
  }

  if (month > 12) {
    year += (month - 1) / 12;
    month = ((month - 1) % 12) + 1;
    return;
  }
}

void TzDateTime::normalize(
  int &day, int &hour, int &minute, int &sec, int &nsec)
{
  if (nsec < 0) {
    sec -= (999999999 - nsec) / 1000000000;
    nsec = 999999999 - ((999999999 - nsec) % 1000000000);
  } else if (nsec > 999999999) {
    sec += nsec / 1000000000;
    nsec = nsec % 1000000000;
  }

  if (sec < 0) {
    minute -= (59 - sec) / 60;
    sec = 59 - ((59 - sec) % 60);
  } else if (sec > 59) {
    minute += sec / 60;
    sec = sec % 60;
  }

  if (minute < 0) {
    hour -= (59 - minute) / 60;
    minute = 59 - ((59 - minute) % 60);
  } else if (minute > 59) {
    hour += minute / 60;
    minute = minute % 60;
  }

  if (hour < 0) {
    day -= (23 - hour) / 24;
    hour = 23 - ((23 - hour) % 24);
  } else if (hour > 23) {
    day += hour / 24;
    hour = hour % 24;
  }
}

TzDateTime TzDateTime::add(int64_t sec, int32_t nsec) const
{
  if (TzUnlikely(!*this)) return *this;

  int64_t nsec_ = int64_t(m_nsec) + nsec;
  sec += fdiv(nsec_, 1000000000);
  nsec_ = fmod_(nsec_, 1000000000);

  int64_t sec_ = int64_t(m_sec) + sec;
  int64_t julian = int64_t(m_julian) + fdiv(sec_, 86400);
  sec_ = fmod_(sec_, 86400);

  if (julian <= INT32_MIN || julian > INT32_MAX) return TzDateTime{}; // overflow

  return TzDateTime{Julian{int32_t(julian)}, int32_t(sec_), int32_t(nsec_)};
}

TzDateTime TzDateTime::advance(const TzDuration &d) const
{
  if (TzUnlikely(!*this)) return *this;

  TzDateTime r = *this;

  if (int64_t months =
	d.get(TzDuration::Years) * 12 + d.get(TzDuration::Months)) {
    int year, month, day;
    ymd(year, month, day);
    int64_t m = int64_t(month - 1) + months;
    int64_t y = int64_t(year) + fdiv(m, 12);
    if (y <= INT32_MIN / 2 || y >= INT32_MAX / 2) return TzDateTime{};
    year = y, month = fmod_(m, 12) + 1;
    int n = daysInMonth(year, month);
    if (day > n) day = n;
    r.m_julian = julian(year, month, day);
  }

  if (int64_t days = d.get(TzDuration::Weeks) * 7 + d.get(TzDuration::Days)) {
    int64_t julian = int64_t(r.m_julian) + days;
    if (julian <= INT32_MIN || julian > INT32_MAX) return TzDateTime{};
    r.m_julian = julian;
  }

  if (int64_t sec = d.fixedSeconds(); sec || d.nsec())
    r = r.add(sec, d.nsec());

  return r;
}

TzDateTime TzDateTime::change(const TzChange &c) const
{
  int year, month, day, hour, minute, sec, nsec;
  ymd(year, month, day);
  hmsn(hour, minute, sec, nsec);

  if (c.year()) year = *c.year();
  if (c.month()) month = *c.month();
  if (c.day()) day = *c.day();
  if (c.hour()) hour = *c.hour(), minute = 0, sec = 0, nsec = 0;
  if (c.minute()) minute = *c.minute(), sec = 0, nsec = 0;
  if (c.second()) sec = *c.second(), nsec = 0;
  if (c.nsec()) nsec = *c.nsec();

  if (month < 1 || month > 12) throw TzTimeError::BadField{"month", month};
  if (day < 1 || day > 31) throw TzTimeError::BadField{"day", day};
  if (hour < 0 || hour > 23) throw TzTimeError::BadField{"hour", hour};
  if (minute < 0 || minute > 59) throw TzTimeError::BadField{"minute", minute};
  if (sec < 0 || sec > 59) throw TzTimeError::BadField{"second", sec};
  if (nsec < 0 || nsec > 999999999)
    throw TzTimeError::BadField{"nanosecond", nsec};

  // out of range days roll over into the following month
  return TzDateTime{year, month, day, hour, minute, sec, nsec};
}

TzDateTime TzDateTime::beginningOfMonth() const
{
  int year, month, day;
  ymd(year, month, day);
  return TzDateTime{year, month, 1};
}

TzDateTime TzDateTime::endOfMonth() const
{
  int year, month, day;
  ymd(year, month, day);
  return TzDateTime{
    Julian{julian(year, month, daysInMonth(year, month))}, 86399, 999999999};
}

TzDateTime TzDateTime::beginningOfYear() const
{
  return TzDateTime{year(), 1, 1};
}

TzDateTime TzDateTime::endOfYear() const
{
  return TzDateTime{Julian{julian(year(), 12, 31)}, 86399, 999999999};
}

TzDateTime::Value TzDateTime::call(std::string_view name) const
{
  using Fn = Value (*)(const TzDateTime &);
  struct Op { const char *name; Fn fn; };
  static const Op ops[] = {
    { "year", [](const TzDateTime &v) -> Value { return int64_t(v.year()); } },
    { "month", [](const TzDateTime &v) -> Value { return int64_t(v.month()); } },
    { "day", [](const TzDateTime &v) -> Value { return int64_t(v.day()); } },
    { "hour", [](const TzDateTime &v) -> Value { return int64_t(v.hour()); } },
    { "minute", [](const TzDateTime &v) -> Value { return int64_t(v.minute()); } },
    { "second", [](const TzDateTime &v) -> Value { return int64_t(v.second()); } },
    { "nsec", [](const TzDateTime &v) -> Value { return int64_t(v.nsec()); } },
    { "wday", [](const TzDateTime &v) -> Value { return int64_t(v.wday()); } },
    { "yday", [](const TzDateTime &v) -> Value { return int64_t(v.yday()); } },
    { "as_time_t", [](const TzDateTime &v) -> Value { return v.as_time_t(); } },
    { "beginningOfDay", [](const TzDateTime &v) -> Value {
      return v.beginningOfDay(); } },
    { "midnight", [](const TzDateTime &v) -> Value {
      return v.beginningOfDay(); } },
    { "middleOfDay", [](const TzDateTime &v) -> Value {
      return v.middleOfDay(); } },
    { "noon", [](const TzDateTime &v) -> Value { return v.middleOfDay(); } },
    { "endOfDay", [](const TzDateTime &v) -> Value { return v.endOfDay(); } },
    { "beginningOfHour", [](const TzDateTime &v) -> Value {
      return v.beginningOfHour(); } },
    { "endOfHour", [](const TzDateTime &v) -> Value { return v.endOfHour(); } },
    { "beginningOfMinute", [](const TzDateTime &v) -> Value {
      return v.beginningOfMinute(); } },
    { "endOfMinute", [](const TzDateTime &v) -> Value {
      return v.endOfMinute(); } },
    { "beginningOfMonth", [](const TzDateTime &v) -> Value {
      return v.beginningOfMonth(); } },
    { "endOfMonth", [](const TzDateTime &v) -> Value {
      return v.endOfMonth(); } },
    { "beginningOfYear", [](const TzDateTime &v) -> Value {
      return v.beginningOfYear(); } },
    { "endOfYear", [](const TzDateTime &v) -> Value { return v.endOfYear(); } },
    { "tomorrow", [](const TzDateTime &v) -> Value { return v.tomorrow(); } },
    { "yesterday", [](const TzDateTime &v) -> Value { return v.yesterday(); } },
    { "allDay", [](const TzDateTime &v) -> Value { return v.allDay(); } },
    { "allMonth", [](const TzDateTime &v) -> Value { return v.allMonth(); } },
    { "allYear", [](const TzDateTime &v) -> Value { return v.allYear(); } }
  };

  for (const auto &op : ops)
    if (name == op.name) return op.fn(*this);

  throw TzTimeError::UnsupportedOperation{std::string{name}, iso_()};
}

void TzDateTimePrintStrftime::print(std::ostream &s) const
{
  auto format = this->format;

  if (!format || !*format) return;

  TzDateTime value = this->value + tzOffset;

  int year, month, day, hour, minute, second;
  value.ymd(year, month, day);
  value.hms(hour, minute, second);
  int days = value.days(year, 1, 1);
  int wkDay = value.julian() % 7;
  if (wkDay < 0) wkDay += 7;
  ++wkDay; // 1 is Monday
  int hour12 = hour % 12;
  if (!hour12) hour12 = 12;

  while (char c = *format++) {
    if (c != '%') { s << c; continue; }
    unsigned width = 0;
    bool noPad = false, colon = false;
fmtchar:
    c = *format++;
    // w is the field width, p the pad character
    auto w = [&](unsigned deflt) { return noPad ? 0U : width ? width : deflt; };
    switch (c) {
      case '\0':
	s << '%';
	return;
      case 'E': // (SU) alt. format
      case 'O': // (SU) alt. digits
	goto fmtchar;
      case '-': // (GNU) no padding
	noPad = true;
	goto fmtchar;
      case ':':
	colon = true;
	goto fmtchar;
      case '0':
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7':
      case '8':
      case '9': // (GNU) field width specifier
	width = width * 10 + (c - '0');
	goto fmtchar;
      case 'a': // (C90) day of week - short name
	s << TzDateTime::dayShortName(wkDay);
	break;
      case 'A': // (C90) day of week - long name
	s << TzDateTime::dayLongName(wkDay);
	break;
      case 'b': // (C90) month - short name
      case 'h': // (SU) ''
	s << TzDateTime::monthShortName(month);
	break;
      case 'B': // (C90) month - long name
	s << TzDateTime::monthLongName(month);
	break;
      case 'c': // (C90) Unix asctime() / ctime() (%a %b %e %T %Y)
	s << TzDateTime::dayShortName(wkDay) << ' ' <<
	  TzDateTime::monthShortName(month) << ' ';
	field(s, day, 2, ' '); s << ' ';
	field(s, hour, 2); s << ':';
	field(s, minute, 2); s << ':';
	field(s, second, 2); s << ' ';
	field(s, year, 4);
	break;
      case 'C': // (SU) century
	field(s, fdiv(year, 100), w(2));
	break;
      case 'd': // (C90) day of month
	field(s, day, w(2));
	break;
      case 'x': // (C90) %m/%d/%y
      case 'D': // (SU) ''
	field(s, month, 2); s << '/';
	field(s, day, 2); s << '/';
	field(s, fmod_(year, 100), 2);
	break;
      case 'e': // (SU) day of month - space padded
	field(s, day, w(2), ' ');
	break;
      case 'F': // (C99) %Y-%m-%d per ISO 8601
	field(s, year, 4); s << '-';
	field(s, month, 2); s << '-';
	field(s, day, 2);
	break;
      case 'g': // (TZ) ISO week date year (2 digits)
      case 'G': // (TZ) '' (4 digits)
	{
	  int wkYearISO, weekISO, wkDay_;
	  value.ywdISO(year, days, wkYearISO, weekISO, wkDay_);
	  if (c == 'g')
	    field(s, fmod_(wkYearISO, 100), w(2));
	  else
	    field(s, wkYearISO, w(4));
	}
	break;
      case 'H': // (C90) hour (24hr)
	field(s, hour, w(2));
	break;
      case 'k': // (GNU) hour (24hr) - space padded
	field(s, hour, w(2), ' ');
	break;
      case 'I': // (C90) hour (12hr)
	field(s, hour12, w(2));
	break;
      case 'l': // (GNU) hour (12hr) - space padded
	field(s, hour12, w(2), ' ');
	break;
      case 'j': // (C90) day of year
	field(s, days + 1, w(3));
	break;
      case 'L': // millisecond
	frac(s, value.nsec(), width ? width : 3);
	break;
      case 'm': // (C90) month
	field(s, month, w(2));
	break;
      case 'M': // (C90) minute
	field(s, minute, w(2));
	break;
      case 'n': // (SU) newline
	s << '\n';
	break;
      case 'N': // nanosecond
	frac(s, value.nsec(), width ? width : 9);
	break;
      case 'p': // (C90) AM/PM
	s << (hour >= 12 ? "PM" : "AM");
	break;
      case 'P': // (GNU) am/pm
	s << (hour >= 12 ? "pm" : "am");
	break;
      case 'r': // (SU) %I:%M:%S %p
	field(s, hour12, 2); s << ':';
	field(s, minute, 2); s << ':';
	field(s, second, 2); s << ' ' << (hour >= 12 ? "PM" : "AM");
	break;
      case 'R': // (SU) %H:%M
	field(s, hour, 2); s << ':';
	field(s, minute, 2);
	break;
      case 's': // (TZ) number of seconds since the Epoch
	field(s, this->value.as_time_t(), noPad ? 0 : width);
	break;
      case 'S': // (C90) second
	field(s, second, w(2));
	break;
      case 't': // (SU) TAB
	s << '\t';
	break;
      case 'X': // (C90) %H:%M:%S
      case 'T': // (SU) ''
	field(s, hour, 2); s << ':';
	field(s, minute, 2); s << ':';
	field(s, second, 2);
	break;
      case 'u': // (SU) week day as decimal (1-7), 1 is Monday (7 is Sunday)
	field(s, wkDay, w(1));
	break;
      case 'U': // (C90) week (00-53), 1st Sunday in year is 1st day of week 1
	{
	  int week, wkDay_;
	  value.ywdSun(days, week, wkDay_);
	  field(s, week, w(2));
	}
	break;
      case 'V': // (SU) week (01-53), per ISO week date
	{
	  int wkYearISO, weekISO, wkDay_;
	  value.ywdISO(year, days, wkYearISO, weekISO, wkDay_);
	  field(s, weekISO, w(2));
	}
	break;
      case 'w': // (C90) week day as decimal, 0 is Sunday
	field(s, wkDay == 7 ? 0 : wkDay, w(1));
	break;
      case 'W': // (C90) week (00-53), 1st Monday in year is 1st day of week 1
	{
	  int week, wkDay_;
	  value.ywd(days, week, wkDay_);
	  field(s, week, w(2));
	}
	break;
      case 'y': // (C90) year (2 digits)
	field(s, fmod_(year, 100), w(2));
	break;
      case 'Y': // (C90) year (4 digits)
	field(s, year, w(4));
	break;
      case 'z': // (GNU) RFC 822 timezone offset
	offset(s, tzOffset, colon);
	break;
      case 'Z': // (C90) timezone
	if (!tzOffset)
	  s << "UTC";
	else
	  offset(s, tzOffset, false);
	break;
      case '%':
	s << '%';
	break;
      default: // unknown conversions are printed verbatim
	s << '%' << c;
	break;
    }
  }
}

void TzDateTimePrintISO::print(std::ostream &s) const
{
  if (TzUnlikely(!value)) return;

  TzDateTime value = this->value + tzOffset;

  int year, month, day, hour, minute, second;
  value.ymd(year, month, day);
  value.hms(hour, minute, second);

  field(s, year, 4); s << '-';
  field(s, month, 2); s << '-';
  field(s, day, 2); s << 'T';
  field(s, hour, 2); s << ':';
  field(s, minute, 2); s << ':';
  field(s, second, 2);
  if (ndp < 0) {
    if (int32_t nsec = value.nsec()) {
      unsigned n = 9;
      while (!(nsec % 10)) nsec /= 10, --n;
      s << '.';
      frac(s, value.nsec(), n);
    }
  } else if (ndp > 0) {
    s << '.';
    frac(s, value.nsec(), ndp);
  }
  if (!tzOffset && zulu)
    s << 'Z';
  else
    offset(s, tzOffset, true);
}

std::string TzDateTime::strftime_(const char *format, int tzOffset) const
{
  std::ostringstream s;
  s << strftime(format, tzOffset);
  return s.str();
}

std::string TzDateTime::iso_(int tzOffset, int ndp, bool zulu) const
{
  std::ostringstream s;
  s << iso(tzOffset, ndp, zulu);
  return s.str();
}

unsigned TzDateTime::scan(
    std::string_view s, int tzOffset, bool *explicitOffset)
{
  if (explicitOffset) *explicitOffset = false;
  {
    const char *ptr = s.data();
    const char *end = ptr + s.length();
    auto digits = [&ptr, end](unsigned n, int &v) {
      if (end - ptr < static_cast<ptrdiff_t>(n)) return false;
      v = 0;
      for (unsigned i = 0; i < n; i++) {
	unsigned c = ptr[i] - '0';
	if (c >= 10) return false;
	v = v * 10 + c;
      }
      ptr += n;
      return true;
    };
    int year, month, day, hour = 0, minute = 0, sec = 0, nsec = 0;
    bool bc = false;

    if (ptr < end && *ptr == '-') { bc = true; ++ptr; }
    if (!digits(4, year)) goto invalid;
    if (TzUnlikely(bc)) year = -year;
    if (ptr >= end || *ptr++ != '-') goto invalid;
    if (!digits(2, month) || month < 1 || month > 12) goto invalid;
    if (ptr >= end || *ptr++ != '-') goto invalid;
    if (!digits(2, day) || day < 1 || day > daysInMonth(year, month))
      goto invalid;

    if (end - ptr >= 6 && (*ptr == 'T' || *ptr == ' ') &&
	static_cast<unsigned>(ptr[1] - '0') < 10) {
      ++ptr;
      if (!digits(2, hour) || hour > 23) goto invalid;
      if (ptr >= end || *ptr++ != ':') goto invalid;
      if (!digits(2, minute) || minute > 59) goto invalid;
      if (ptr < end && *ptr == ':') {
	++ptr;
	if (!digits(2, sec) || sec > 60) goto invalid;
	if (ptr < end && (*ptr == '.' || *ptr == ',')) {
	  ++ptr;
	  unsigned pow = 100000000, n = 0;
	  while (ptr < end) {
	    unsigned c = *ptr - '0';
	    if (c >= 10) break;
	    nsec += c * pow;
	    pow /= 10;
	    ++ptr, ++n;
	  }
	  if (!n) goto invalid;
	}
      }
    }

    normalize(day, hour, minute, sec, nsec);
    m_julian = julian(year, month, day);
    m_sec = second(hour, minute, sec);
    m_nsec = nsec;

    if (ptr < end) {
      if (*ptr == 'Z') {
	if (explicitOffset) *explicitOffset = true;
	return ++ptr - s.data();
      }
      if (*ptr == '+' || *ptr == '-') {
	int sign = *ptr++ == '-' ? -1 : 1;
	int oH, oM = 0;
	if (!digits(2, oH) || oH > 23) goto invalid;
	if (ptr < end && *ptr == ':') ++ptr;
	if (ptr < end && static_cast<unsigned>(*ptr - '0') < 10)
	  if (!digits(2, oM) || oM > 59) goto invalid;
	*this = add(-int64_t(sign * (oH * 3600 + oM * 60)));
	if (explicitOffset) *explicitOffset = true;
	return ptr - s.data();
      }
    }

    if (tzOffset) *this = add(-int64_t(tzOffset));
    return ptr - s.data();
  }

invalid:
  null();
  return 0;
}

TzDateTime TzDateTime::parse(std::string_view s, bool *explicitOffset)
{
  TzDateTime v;
  if (v.scan(s, 0, explicitOffset) != s.length() || !v)
    throw TzTimeError::BadFormat{"ISO 8601 date/time", std::string{s}};
  return v;
}
