//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zone conversion tool

#include <stdlib.h>

#include <iostream>
#include <string>
#include <vector>

#include <tzlib/TzCf.hh>
#include <tzlib/TzInit.hh>
#include <tzlib/TzLog.hh>
#include <tzlib/TzTime.hh>
#include <tzlib/TzZones.hh>

#include "../../version.h"

void usage()
{
  std::cerr <<
    "Usage: tzconv [OPTION]... TIME...\n"
    "  Convert each TIME (YYYY-MM-DD[THH:MM[:SS[.f]]][Z|+HH[[:]MM]], or now)\n"
    "  from the source zone to each destination zone\n\n"
    "Options:\n"
    "  -z, --zone=ZONE\tsource zone (default: configured zone, or UTC)\n"
    "  -t, --to=ZONE[,ZONE]...\tdestination zones (default: source zone)\n"
    "  -f, --format=FORMAT\tnamed format (default, db, number, short, long,\n"
    "\t\t\tlong_ordinal, rfc822, iso8601) or strftime pattern\n"
    "  -u, --utc\t\tTIME is UTC rather than wall-clock in the source zone\n"
    "  -c, --config=FILE\tread configuration from FILE\n"
    "  -v, --verbose\t\tlog at Debug level\n"
    "      --version\t\tprint version\n"
    "      --help\t\tthis help\n"
    << std::flush;
  exit(1);
}

namespace {

TzTime convert(std::string_view text, const TzZoneRef &zone, bool utc)
{
  if (text == "now") return TzTime::now(zone);
  if (utc) return TzTime::fromUTC(TzDateTime::parse(text), zone);
  return TzTime::parse(text, zone);
}

} // namespace

int main(int argc, char **argv)
{
  static const TzOpt options[] = {
    { 'z', "zone", TzOptType::Param, "source" },
    { 't', "to", TzOptType::Array, "to" },
    { 'f', "format", TzOptType::Param, "format" },
    { 'u', "utc", TzOptType::Flag, "utc" },
    { 'c', "config", TzOptType::Param, "config" },
    { 'v', "verbose", TzOptType::Flag, "verbose" },
    { 0, "version", TzOptType::Flag, "version" },
    { 0, "help", TzOptType::Flag, "help" },
    { 0, nullptr, 0, nullptr }
  };

  auto cf = TzCf::make();
  unsigned argc_ = 0;

  try {
    argc_ = cf->fromArgs(options, TzCf::args(argc, argv));
    if (cf->getBool("help")) usage();
    if (cf->getBool("version")) {
      std::cout << "tzconv " << TZ_VERNAME << '\n' << std::flush;
      return 0;
    }
    if (argc_ < 2) usage();
    if (auto path = cf->get("config"); !path.empty()) {
      auto fileCf = TzCf::make();
      fileCf->fromFile(std::string{path});
      Tz::init(fileCf.get());
    } else
      Tz::init(nullptr);
    if (cf->getBool("verbose")) TzLog::level(Tz::Debug);
  } catch (const TzError &e) {
    std::cerr << e << '\n' << std::flush;
    usage();
  }

  try {
    TzZoneRef source = Tz::defaultZone();
    if (auto zone = cf->get("source"); !zone.empty())
      source = Tz::findZone(zone);

    std::vector<TzZoneRef> zones;
    if (auto to = cf->getStrArray("to"))
      for (const auto &zone : *to) zones.push_back(Tz::findZone(zone));
    if (zones.empty()) zones.push_back(source);

    std::string format = cf->get("format", "default");
    bool pattern = format.find('%') != std::string::npos;
    bool utc = cf->getBool("utc");

    for (unsigned i = 1; i < argc_; i++) {
      auto t = convert(cf->get<true>(std::to_string(i)), source, utc);
      TzLOG(Debug, ([&](auto &s) { s << "converting " << t.inspect(); }));
      for (const auto &zone : zones) {
	auto t_ = t.inZone(zone);
	std::cout << (pattern ? t_.strftime(format) : t_.toString(format))
	  << '\n';
      }
    }
    std::cout << std::flush;
  } catch (const TzError &e) {
    TzLOG(Error, e);
    return 1;
  } catch (const std::exception &e) {
    TzLOG(Error, e.what());
    return 1;
  }
  return 0;
}
