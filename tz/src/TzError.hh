//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// generic Tz error exception, time/zone errors

#ifndef TzError_HH
#define TzError_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <exception>
#include <string>
#include <sstream>
#include <ostream>

class TzAPI TzError : public std::exception {
public:
  virtual ~TzError() { }
  virtual void print_(std::ostream &) const = 0;
  void print(std::ostream &s) const { print_(s); }

  const char *what() const noexcept {
    if (m_what.empty()) {
      try {
	std::ostringstream s;
	print_(s);
	m_what = s.str();
      } catch (const std::exception &) {
	return "TzError";
      }
    }
    return m_what.c_str();
  }

  friend std::ostream &operator <<(std::ostream &s, const TzError &e) {
    e.print_(s);
    return s;
  }

private:
  mutable std::string	m_what;
};

namespace TzTimeError {

// thrown by TzTime::change() when both zone and offset are given
class ConflictingZoneSpec : public TzError {
public:
  ConflictingZoneSpec(std::string zone, std::string offset) :
      m_zone{std::move(zone)}, m_offset{std::move(offset)} { }
  void print_(std::ostream &s) const {
    s << "can't change both zone and offset at the same time: zone=\""
      << m_zone << "\" offset=\"" << m_offset << '"';
  }
private:
  std::string	m_zone;
  std::string	m_offset;
};

// thrown by TzZone::periodForLocal() for a local time in a gap
class NoSuchLocalTime : public TzError {
public:
  NoSuchLocalTime(std::string local, std::string zone) :
      m_local{std::move(local)}, m_zone{std::move(zone)} { }
  const std::string &local() const { return m_local; }
  const std::string &zone() const { return m_zone; }
  void print_(std::ostream &s) const {
    s << '"' << m_local << "\" is not a valid local time in \""
      << m_zone << '"';
  }
private:
  std::string	m_local;
  std::string	m_zone;
};

// thrown by TzTime::fromLocal() when gap resolution is exhausted
class AmbiguousLocalTime : public TzError {
public:
  AmbiguousLocalTime(std::string local, std::string zone, unsigned retries) :
      m_local{std::move(local)}, m_zone{std::move(zone)},
      m_retries{retries} { }
  void print_(std::ostream &s) const {
    s << '"' << m_local << "\" could not be resolved in \"" << m_zone
      << "\" after " << m_retries << " hourly adjustments";
  }
private:
  std::string	m_local;
  std::string	m_zone;
  unsigned	m_retries;
};

// thrown by call() for an operation name outside the delegated set
class UnsupportedOperation : public TzError {
public:
  UnsupportedOperation(std::string op, std::string target) :
      m_op{std::move(op)}, m_target{std::move(target)} { }
  const std::string &op() const { return m_op; }
  const std::string &target() const { return m_target; }
  void print_(std::ostream &s) const {
    s << "undefined operation '" << m_op << "' for " << m_target;
  }
private:
  std::string	m_op;
  std::string	m_target;
};

// thrown by Tz::findZone()
class UnknownZone : public TzError {
public:
  UnknownZone(std::string name) : m_name{std::move(name)} { }
  const std::string &name() const { return m_name; }
  void print_(std::ostream &s) const {
    s << "unknown time zone \"" << m_name << '"';
  }
private:
  std::string	m_name;
};

// thrown by change() for out of range fields
class BadField : public TzError {
public:
  BadField(const char *field, int value) : m_field{field}, m_value{value} { }
  void print_(std::ostream &s) const {
    s << "invalid " << m_field << ' ' << m_value;
  }
private:
  const char	*m_field;
  int		m_value;
};

// thrown by parse functions
class BadFormat : public TzError {
public:
  BadFormat(const char *type, std::string input) :
      m_type{type}, m_input{std::move(input)} { }
  void print_(std::ostream &s) const {
    s << "invalid " << m_type << " \"" << m_input << '"';
  }
private:
  const char	*m_type;
  std::string	m_input;
};

// thrown by TzTime::operator +=() and -=() on a frozen value
class Frozen : public TzError {
public:
  Frozen(std::string value) : m_value{std::move(value)} { }
  void print_(std::ostream &s) const {
    s << "can't modify frozen time " << m_value;
  }
private:
  std::string	m_value;
};

} // TzTimeError

#endif /* TzError_HH */
