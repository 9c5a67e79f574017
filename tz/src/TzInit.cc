//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// library initialization from configuration

#include <tzlib/TzInit.hh>
#include <tzlib/TzCf.hh>
#include <tzlib/TzLog.hh>
#include <tzlib/TzZones.hh>
#include <tzlib/TzFormats.hh>
#include <tzlib/TzSysZone.hh>

namespace {

void initLog(const TzCf *cf)
{
  if (auto level = cf->get("level"); !level.empty()) {
    int i = Tz::severity(level);
    if (i < 0)
      throw TzCfError::Range{cf, "level", Tz::Debug, Tz::Fatal,
	std::string{level}};
    TzLog::level(i);
  }
  auto path = cf->get("path");
  auto tzOffset_ = cf->get("tzOffset");
  if (path.empty() && tzOffset_.empty()) return;
  int tzOffset = 0;
  if (!tzOffset_.empty() && !Tz::parseOffset(tzOffset_, tzOffset))
    throw TzTimeError::BadFormat{"UTC offset", std::string{tzOffset_}};
  TzLog::sink(TzLog::fileSink(
	TzSinkOptions{}.path(std::string{path}).tzOffset(tzOffset)));
}

} // namespace

void Tz::init(const TzCf *cf)
{
  Tz::tzset();

  if (!cf) return;

  if (auto log = cf->getCf("log")) initLog(log.get());

  if (auto zones = cf->getCf("zones"))
    zones->all([&zones](std::string_view alias, const TzCf::Data &data) {
      auto spec = std::get_if<std::string>(&data);
      if (!spec) throw TzCfError::Required{zones.get(), alias};
      TzZones::instance()->alias(std::string{alias}, *spec);
      TzLOG(Debug, ([&](auto &s) {
	s << "zone alias " << alias << " -> " << *spec;
      }));
    });

  if (auto formats = cf->getCf("formats"))
    formats->all([&formats](std::string_view name, const TzCf::Data &data) {
      auto pattern = std::get_if<std::string>(&data);
      if (!pattern) throw TzCfError::Required{formats.get(), name};
      TzFormats::instance()->add(std::string{name}, *pattern);
    });

  if (auto zone = cf->get("zone"); !zone.empty()) {
    Tz::defaultZone(Tz::findZone(zone));
    TzLOG(Info, ([&](auto &s) { s << "default zone " << zone; }));
  }
}
