//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

// TzLog::level(Tz::Warning);
// TzLog::sink(TzLog::fileSink(TzSinkOptions{}.path("tz.log")));
// TzLOG(Debug, "debug message");	// TzLOG() is macro
// TzLOG(Warning, [&](auto &s) { s << "zone " << name << " not found"; });
// try { ... } catch (const TzError &e) { TzLOG(Error, e); }

// if no sink is registered, the default sink is stderr

#ifndef TzLog_HH
#define TzLog_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <stdio.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <tzlib/TzDateTime.hh>

// normalized severity levels
namespace Tz {
  enum { Debug = 0, Info, Warning, Error, Fatal };

  TzExtern const char *severity(int i);
  // returns -1 if invalid
  TzExtern int severity(std::string_view s);

  // strip directory from __FILE__
  TzExtern std::string_view file(std::string_view s);
}

// event time, severity, file name, line number, function
struct TzEventInfo {
  TzDateTime	time;
  int		severity;	// Tz:: Debug, Info, Warning, Error, Fatal
  const char	*file;
  int		line;
  const char	*function;

  TzEventInfo(
      int severity_,
      const char *file_, int line_,
      const char *function_) :
    time{TzDateTime::now()},
    severity{severity_},
    file{file_}, line{line_},
    function{function_} { }
};

namespace TzSinkType {
  enum { File = 0, Lambda };
}
struct TzSink {
  int	type;	// TzSinkType

  TzSink(int type_) : type(type_) { }
  virtual ~TzSink() { }

  virtual void pre(std::ostream &, const TzEventInfo &) = 0;
  virtual void post(const std::string &, const TzEventInfo &) = 0;
};

struct TzSinkOptions {
  TzSinkOptions &path(std::string path) {
    m_path = std::move(path);
    return *this;
  }
  TzSinkOptions &tzOffset(int tzOffset)
    { m_tzOffset = tzOffset; return *this; }

  const auto &path() const { return m_path; }
  auto tzOffset() const { return m_tzOffset; }

private:
  std::string	m_path;
  int		m_tzOffset = 0;
};

// prints "YYYY/MM/DD HH:MM:SS.nnnnnnnnn severity ..." at tzOffset
class TzAPI TzFileSink : public TzSink {
public:
  TzFileSink() : TzSink{TzSinkType::File} { init(); }
  TzFileSink(const TzSinkOptions &options) :
      TzSink{TzSinkType::File}, m_path{options.path()},
      m_tzOffset{options.tzOffset()} { init(); }

  ~TzFileSink();

  void pre(std::ostream &, const TzEventInfo &);
  void post(const std::string &, const TzEventInfo &);

  const std::string &path() const { return m_path; }

private:
  void init();

  std::string		m_path;		// "&2" is stderr
  int			m_tzOffset = 0;

  std::mutex		m_lock;
    FILE *		  m_file = nullptr;
};

struct TzAPI TzLambdaSink_ : public TzSink {
  TzLambdaSink_(int tzOffset = 0) :
      TzSink{TzSinkType::Lambda}, m_tzOffset{tzOffset} { }

  void pre(std::ostream &, const TzEventInfo &);

private:
  int	m_tzOffset;
};
template <typename L>
struct TzLambdaSink : public TzLambdaSink_ {
  L	l;

  TzLambdaSink(L l_, int tzOffset = 0) :
      TzLambdaSink_{tzOffset}, l{std::move(l_)} { }

  void post(const std::string &buf, const TzEventInfo &info) { l(buf, info); }
};

class TzAPI TzLog {
  TzLog(const TzLog &) = delete;
  TzLog &operator =(const TzLog &) = delete;

  using Lock = std::mutex;
  using Guard = std::lock_guard<Lock>;

  TzLog() = default;

public:
  static TzLog *instance();

  template <typename ...Args>
  static std::shared_ptr<TzSink> fileSink(Args &&...args) {
    return std::make_shared<TzFileSink>(std::forward<Args>(args)...);
  }
  template <typename L>
  static std::shared_ptr<TzSink> lambdaSink(L &&l, int tzOffset = 0) {
    return std::make_shared<TzLambdaSink<std::decay_t<L>>>(
	std::forward<L>(l), tzOffset);
  }

  static int level() { return instance()->level_(); }
  static void level(int l) { instance()->level_(l); }

  static std::shared_ptr<TzSink> sink() { return instance()->sink_(); }
  static void sink(std::shared_ptr<TzSink> sink) {
    instance()->sink_(std::move(sink));
  }

  // msg is a string literal, anything printable, or a lambda
  // [...](auto &s) { s << ... }
  template <typename Msg>
  static void log(
      int severity, const char *file, int line, const char *function,
      Msg &&msg) {
    instance()->log_(
	TzEventInfo{severity, file, line, function}, std::forward<Msg>(msg));
  }

  template <typename Msg>
  void log_(const TzEventInfo &info, Msg &&msg) {
    if (info.severity < m_level.load(std::memory_order_relaxed)) return;
    auto sink = sink_();
    std::ostringstream s;
    sink->pre(s, info);
    if constexpr (std::is_invocable_v<Msg &, std::ostream &>)
      msg(s);
    else
      s << msg;
    s << '\n';
    sink->post(s.str(), info);
  }

private:
  int level_() const { return m_level.load(std::memory_order_relaxed); }
  void level_(int l) { m_level.store(l, std::memory_order_relaxed); }

  std::shared_ptr<TzSink> sink_();
  void sink_(std::shared_ptr<TzSink> sink);

  std::atomic<int>	m_level = Tz::Info;

  Lock			m_lock;
    std::shared_ptr<TzSink> m_sink;
};

#ifndef TZDEBUG

// filter out DEBUG messages in production builds
#define TzLOG_(sev, msg) \
  ((sev > Tz::Debug) ? \
   TzLog::log(sev, __FILE__, __LINE__, __func__, msg) : void())

#else /* !TZDEBUG */

#define TzLOG_(sev, msg) TzLog::log(sev, __FILE__, __LINE__, __func__, msg)

#endif /* !TZDEBUG */

#define TzLOG(sev, msg) TzLOG_(Tz:: sev, msg)

#endif /* TzLog_HH */
