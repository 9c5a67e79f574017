//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// zone registry

#include <tzlib/TzZones.hh>
#include <tzlib/TzPosixZone.hh>
#include <tzlib/TzSysZone.hh>
#include <tzlib/TzError.hh>

TzZones::TzZones()
{
  m_utc = std::make_shared<TzFixedZone>(0);
  m_default = m_utc;
  m_zones.emplace(m_utc->name(), m_utc);
}

TzZones *TzZones::instance()
{
  static TzZones zones;
  return &zones;
}

TzZoneRef TzZones::find(std::string_view name)
{
  std::lock_guard<std::recursive_mutex> guard(m_lock);
  return find_(name, 0);
}

TzZoneRef TzZones::find_(std::string_view name, unsigned depth)
{
  if (auto i = m_zones.find(name); i != m_zones.end()) return i->second;

  TzZoneRef zone;

  if (auto i = m_aliases.find(name); i != m_aliases.end()) {
    if (depth >= 8) throw TzTimeError::UnknownZone{std::string{name}};
    std::string spec = i->second;
    zone = find_(spec, depth + 1);
  } else if (name == "UTC" || name == "GMT" || name == "UCT" || name == "Z") {
    zone = m_utc;
  } else if (int offset; Tz::parseOffset(name, offset)) {
    zone = find(offset);
  } else if (Tz::sysZoneExists(std::string{name})) {
    zone = std::make_shared<TzSysZone>(std::string{name});
  } else if (TzPosixZone::valid(name)) {
    zone = std::make_shared<TzPosixZone>(std::string{name});
  } else
    throw TzTimeError::UnknownZone{std::string{name}};

  m_zones.emplace(std::string{name}, zone);
  return zone;
}

TzZoneRef TzZones::find(int offset)
{
  std::lock_guard<std::recursive_mutex> guard(m_lock);
  if (!offset) return m_utc;
  std::string name = Tz::formatOffset(offset, true, true);
  if (auto i = m_zones.find(name); i != m_zones.end()) return i->second;
  TzZoneRef zone = std::make_shared<TzFixedZone>(offset);
  m_zones.emplace(std::move(name), zone);
  return zone;
}

void TzZones::alias(std::string alias, std::string_view spec)
{
  std::lock_guard<std::recursive_mutex> guard(m_lock);
  find_(spec, 0);
  m_zones.erase(alias);
  m_aliases[std::move(alias)] = std::string{spec};
}

TzZoneRef TzZones::defaultZone() const
{
  std::lock_guard<std::recursive_mutex> guard(m_lock);
  return m_default;
}

void TzZones::defaultZone(TzZoneRef zone)
{
  std::lock_guard<std::recursive_mutex> guard(m_lock);
  m_default = zone ? std::move(zone) : m_utc;
}
