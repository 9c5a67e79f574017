//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

#include <errno.h>
#include <string.h>

#include <tzlib/TzLog.hh>

const char *Tz::severity(int i)
{
  static const char *names[] = {
    "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"
  };
  return (i < 0 || i > 4) ? "UNKNOWN" : names[i];
}

int Tz::severity(std::string_view s)
{
  for (int i = Tz::Debug; i <= Tz::Fatal; i++) {
    std::string_view name = severity(i);
    if (s.length() != name.length()) continue;
    unsigned j, n = s.length();
    for (j = 0; j < n; j++)
      if ((s[j] & ~0x20) != name[j]) break;
    if (j == n) return i;
  }
  if (s.length() == 1 && s[0] >= '0' && s[0] <= '4') return s[0] - '0';
  return -1;
}

std::string_view Tz::file(std::string_view s)
{
  auto i = s.rfind('/');
  if (i == std::string_view::npos) return s;
  return s.substr(i + 1);
}

TzLog *TzLog::instance()
{
  static TzLog log;
  return &log;
}

std::shared_ptr<TzSink> TzLog::sink_()
{
  Guard guard(m_lock);
  if (TzUnlikely(!m_sink)) m_sink = fileSink(); // default to stderr
  return m_sink;
}

void TzLog::sink_(std::shared_ptr<TzSink> sink)
{
  Guard guard(m_lock);
  m_sink = std::move(sink);
}

namespace {

void prefix(std::ostream &s, const TzEventInfo &info, int tzOffset)
{
  s << info.time.strftime("%Y/%m/%d %H:%M:%S.%N", tzOffset) << ' ' <<
    Tz::severity(info.severity) << ' ';
  if (info.severity == Tz::Debug || info.severity == Tz::Fatal)
    s << '\"' << Tz::file(info.file) << "\":" << info.line << ' ';
  s << info.function << "() ";
}

} // namespace

// suppress security warnings about fopen()
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:4996)
#endif

void TzFileSink::init()
{
  if (m_path.empty()) m_path = "&2";

  if (m_path != "&2") m_file = fopen(m_path.c_str(), "a");

  if (!m_file) {
    m_file = stderr;
    if (m_path != "&2")
      fprintf(stderr, "TzLog: \"%s\" %s - logging to stderr\n",
	  m_path.c_str(), strerror(errno));
  }
}

TzFileSink::~TzFileSink()
{
  if (m_file && m_file != stderr) fclose(m_file);
}

void TzFileSink::pre(std::ostream &s, const TzEventInfo &info)
{
  prefix(s, info, m_tzOffset);
}

void TzFileSink::post(const std::string &buf, const TzEventInfo &info)
{
  std::lock_guard<std::mutex> guard(m_lock);

  fwrite(buf.data(), 1, buf.length(), m_file);
  if (info.severity > Tz::Debug) fflush(m_file);
}

#ifdef _MSC_VER
#pragma warning(pop)
#endif

void TzLambdaSink_::pre(std::ostream &s, const TzEventInfo &info)
{
  prefix(s, info, m_tzOffset);
}
