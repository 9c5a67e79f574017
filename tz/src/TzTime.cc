//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// zoned time - a UTC instant and a wall-clock time paired with a zone

#include <tzlib/TzTime.hh>
#include <tzlib/TzFormats.hh>
#include <tzlib/TzError.hh>
#include <tzlib/TzLog.hh>
#include <tzlib/TzCf.hh>

TzTime TzTime::fromUTC_(const TzDateTime &utc, TzZoneRef zone)
{
  if (TzUnlikely(!zone)) return TzTime{};
  auto period = zone->periodForUTC(utc);
  auto local = utc + period.utcOffset;
  return TzTime{std::move(zone), utc, local, std::move(period)};
}

TzTime TzTime::fromLocal(
    const TzDateTime &local_, TzZoneRef zone,
    const std::optional<TzPeriod> &period)
{
  if (TzUnlikely(!zone)) return TzTime{};
  TzDateTime local = local_;
  for (unsigned i = 0; i <= GapRetries; i++) {
    auto periods = zone->periodsForLocal(local);
    if (TzLikely(!periods.empty())) {
      unsigned j = 0;
      // keep the current period if it still covers the resolved instant
      if (period && period->contains(local - period->utcOffset))
	for (unsigned k = 0, n = periods.size(); k < n; k++)
	  if (periods[k] == *period) { j = k; break; }
      auto utc = local - periods[j].utcOffset;
      return TzTime{std::move(zone), utc, local, std::move(periods[j])};
    }
    if (i == GapRetries) break;
    TzLOG(Debug, ([&](auto &s) {
      s << local.strftime("%Y-%m-%d %H:%M:%S") << " does not exist in \""
	<< zone->name() << "\", retrying one hour later";
    }));
    local += 3600;
  }
  throw TzTimeError::AmbiguousLocalTime{
    local_.strftime_("%Y-%m-%d %H:%M:%S"), zone->name(), GapRetries};
}

TzTime TzTime::parse(std::string_view s, TzZoneRef zone)
{
  bool explicitOffset;
  auto value = TzDateTime::parse(s, &explicitOffset);
  if (explicitOffset) return fromUTC(value, std::move(zone));
  return fromLocal(value, std::move(zone));
}

TzTime &TzTime::operator +=(const TzDuration &d)
{
  if (TzUnlikely(m_frozen)) throw TzTimeError::Frozen{inspect()};
  return *this = *this + d;
}

TzTime TzTime::inZone(TzZoneRef zone) const
{
  if (m_zone && zone && m_zone->name() == zone->name()) return *this;
  return fromUTC(utc(), std::move(zone));
}

TzTime TzTime::operator +(const TzDuration &d) const
{
  if (d.variable()) return wrap(local().advance(d));
  return fromUTC(utc().advance(d), m_zone);
}

TzTime TzTime::change(const TzChange &c) const
{
  if (c.zone() && c.offset())
    throw TzTimeError::ConflictingZoneSpec{*c.zone(), *c.offset()};

  TzDateTime local = this->local().change(c);

  if (c.zone()) return fromLocal(local, Tz::findZone(*c.zone()), period());
  if (c.offset()) {
    int offset;
    if (!Tz::parseOffset(*c.offset(), offset))
      throw TzTimeError::BadFormat{"UTC offset", *c.offset()};
    return fromLocal(local, Tz::findZone(offset), period());
  }
  return wrap(local);
}

TzTimeRange TzTime::allDay() const
{
  return {beginningOfDay(), endOfDay()};
}

TzTimeRange TzTime::allMonth() const
{
  return {beginningOfMonth(), endOfMonth()};
}

TzTimeRange TzTime::allYear() const
{
  return {beginningOfYear(), endOfYear()};
}

TzTimeParts TzTime::parts() const
{
  const auto &local = this->local();
  const auto &period = this->period();
  return TzTimeParts{
    local.second(), local.minute(), local.hour(),
    local.day(), local.month(), local.year(),
    local.wday(), local.yday(),
    period.dst, period.abbrev
  };
}

TzTime::Value TzTime::call(std::string_view name) const
{
  if (name == "as_time_t") return as_time_t();

  TzDateTime::Value value;
  try {
    value = local().call(name);
  } catch (const TzTimeError::UnsupportedOperation &e) {
    throw TzTimeError::UnsupportedOperation{e.op(), inspect()};
  }
  return std::visit([this](auto &&v) -> Value {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, TzDateTime>)
      return wrap(v);
    else if constexpr (std::is_same_v<T, TzRange<TzDateTime>>)
      return TzTimeRange{wrap(v.first), wrap(v.last)};
    else
      return v;
  }, value);
}

std::string TzTime::toString(std::string_view format) const
{
  if (format == "db") return utc().strftime_("%Y-%m-%d %H:%M:%S");
  if (format != "default") {
    std::string out;
    if (TzFormats::instance()->render(format, *this, out)) return out;
  }
  std::string s = local().strftime_("%Y-%m-%d %H:%M:%S");
  s += ' ';
  if (int offset = utcOffset())
    s += Tz::formatOffset(offset);
  else
    s += "UTC";
  return s;
}

std::string TzTime::strftime(std::string_view format_) const
{
  std::string format;
  format.reserve(format_.length());
  // substitute %Z, leaving %% escapes for the generic formatter
  for (unsigned i = 0, n = format_.length(); i < n; i++) {
    char c = format_[i];
    if (c != '%' || i + 1 >= n) { format += c; continue; }
    char d = format_[++i];
    if (d == 'Z') {
      for (char a : abbrev()) {
	if (a == '%') format += '%';
	format += a;
      }
      continue;
    }
    format += '%';
    format += d;
  }
  return utc().strftime_(format.c_str(), utcOffset());
}

std::string TzTime::inspect() const
{
  std::string s = local().strftime_("%a, %d %b %Y %H:%M:%S.%N");
  s += ' ';
  s += abbrev();
  s += ' ';
  s += formattedOffset();
  return s;
}

std::string TzTime::iso8601(unsigned ndp) const
{
  std::string s = local().strftime_("%Y-%m-%dT%H:%M:%S");
  if (ndp) {
    std::string frac = local().strftime_("%N");
    s += '.';
    s += frac.substr(0, ndp > 9 ? 9 : ndp);
    if (ndp > 9) s.append(ndp - 9, '0');
  }
  s += formattedOffset(true, "Z");
  return s;
}

std::string TzTime::formattedOffset(
    bool colon, const char *alternateUTC) const
{
  if (alternateUTC && isUTC() && !utcOffset()) return alternateUTC;
  return Tz::formatOffset(utcOffset(), colon);
}

void TzTime::encode(TzCf &cf) const
{
  cf.set("utc", utc().iso_(0, -1, true));
  cf.set("zone", m_zone ? m_zone->name() : std::string{});
  cf.set("time", local().strftime_("%Y-%m-%dT%H:%M:%S.%N"));
}

TzTime TzTime::decode(const TzCf &cf)
{
  auto utc = TzDateTime::parse(cf.get<true>("utc"));
  auto zone = Tz::findZone(cf.get<true>("zone"));
  auto t = fromUTC(utc, std::move(zone));
  if (auto time = cf.get("time"); !time.empty()) {
    auto local = TzDateTime::parse(time);
    if (local != t.local())
      TzLOG(Warning, ([&](auto &s) {
	s << "decoded local time " << time
	  << " disagrees with " << t.inspect();
      }));
  }
  return t;
}
