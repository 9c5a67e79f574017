//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// named time formats for TzTime::toString()

#include <tzlib/TzFormats.hh>
#include <tzlib/TzTime.hh>

std::string Tz::ordinalize(int i)
{
  std::string s = std::to_string(i);
  int n = i < 0 ? -i : i;
  if (n % 100 >= 11 && n % 100 <= 13) return s + "th";
  switch (n % 10) {
    case 1: return s + "st";
    case 2: return s + "nd";
    case 3: return s + "rd";
  }
  return s + "th";
}

TzFormats::TzFormats()
{
  m_formats.emplace("number", std::string{"%Y%m%d%H%M%S"});
  m_formats.emplace("short", std::string{"%d %b %H:%M"});
  m_formats.emplace("long", std::string{"%B %d, %Y %H:%M"});
  m_formats.emplace("long_ordinal", Fn{[](const TzTime &t) {
    std::string s = t.strftime("%B ");
    s += Tz::ordinalize(t.day());
    s += t.strftime(", %Y %H:%M");
    return s;
  }});
  m_formats.emplace("rfc822", std::string{"%a, %d %b %Y %H:%M:%S %z"});
  m_formats.emplace("iso8601", Fn{[](const TzTime &t) {
    return t.iso8601();
  }});
}

TzFormats *TzFormats::instance()
{
  static TzFormats formats;
  return &formats;
}

void TzFormats::add(std::string name, std::string pattern)
{
  std::lock_guard<std::mutex> guard(m_lock);
  m_formats.insert_or_assign(std::move(name), std::move(pattern));
}

void TzFormats::add(std::string name, Fn fn)
{
  std::lock_guard<std::mutex> guard(m_lock);
  m_formats.insert_or_assign(std::move(name), std::move(fn));
}

void TzFormats::del(std::string_view name)
{
  std::lock_guard<std::mutex> guard(m_lock);
  if (auto i = m_formats.find(name); i != m_formats.end())
    m_formats.erase(i);
}

bool TzFormats::exists(std::string_view name) const
{
  std::lock_guard<std::mutex> guard(m_lock);
  return m_formats.find(name) != m_formats.end();
}

bool TzFormats::render(
    std::string_view name, const TzTime &t, std::string &out) const
{
  Format format;
  {
    std::lock_guard<std::mutex> guard(m_lock);
    auto i = m_formats.find(name);
    if (i == m_formats.end()) return false;
    format = i->second;
  }
  if (auto pattern = std::get_if<std::string>(&format))
    out = t.strftime(*pattern);
  else
    out = std::get<Fn>(format)(t);
  return true;
}
