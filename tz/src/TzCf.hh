//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// application configuration

// configuration is a tree of string, string array and nested scopes;
// keys may be dotted paths ("log.level") that traverse nested scopes
//
// file syntax:
//   # comment
//   key value
//   key "quoted value with \"escapes\""
//   key [ a, b, c ]
//   scope { key value ... }
//
// command line syntax (fromArgs()):
//   -f value --flag --param=value positional ...
// positional arguments are keyed "0", "1", ... (argv[0] included),
// "#" is the number of positional arguments

#ifndef TzCf_HH
#define TzCf_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <tzlib/TzError.hh>

#define TzCfMaxFileSize	(1<<20)	// 1Mb

namespace TzOptType {
  enum { Flag = 0, Param, Array };
}

struct TzOpt {
  char		short_;
  const char	*long_;
  int		type;		// TzOptType
  const char	*key;
};

class TzCf;

namespace TzCfError {

// thrown by all get methods for missing required values
class TzAPI Required : public TzError {
public:
  Required(const TzCf *cf, std::string_view key);

  const std::string &key() const { return m_key; }

  void print_(std::ostream &s) const {
    s << '"' << m_key << "\" missing";
  }

private:
  std::string	m_key;
};

// thrown by getBool() on error
class BadBool : public TzError {
public:
  BadBool(std::string key, std::string value) :
      m_key{std::move(key)}, m_value{std::move(value)} { }
  void print_(std::ostream &s) const {
    s << '"' << m_key << "\": invalid bool value \"" << m_value << '"';
  }

private:
  std::string	m_key;
  std::string	m_value;
};

// thrown by getInt() / getInt64() on range or format error
class TzAPI Range : public TzError {
public:
  Range(const TzCf *cf, std::string_view key,
      int64_t minimum, int64_t maximum, std::string value);

  const std::string &key() const { return m_key; }

  void print_(std::ostream &s) const {
    s << '"' << m_key << "\" out of range " <<
      "min(" << m_minimum << ") <= " << m_value <<
      " <= max(" << m_maximum << ")";
  }

private:
  std::string	m_key;
  int64_t	m_minimum;
  int64_t	m_maximum;
  std::string	m_value;
};

// thrown by fromArgs() on error
class Usage : public TzError {
public:
  Usage(std::string_view cmd, std::string_view option) :
    m_cmd{cmd}, m_option{option} { }
  void print_(std::ostream &s) const {
    s << '"' << m_cmd << "\": invalid option \"" << m_option << '"';
  }

private:
  std::string	m_cmd;
  std::string	m_option;
};

// thrown by fromString() and fromFile() on error
class Syntax : public TzError {
public:
  Syntax(unsigned line, char ch, std::string_view fileName) :
    m_line{line}, m_ch{ch}, m_fileName{fileName} { }
  void print_(std::ostream &s) const;

private:
  unsigned	m_line;
  char		m_ch;
  std::string	m_fileName;
};

// thrown by fromFile()
class FileOpenError : public TzError {
public:
  FileOpenError(std::string_view fileName, int errNo) :
    m_fileName{fileName}, m_errNo{errNo} { }
  void print_(std::ostream &s) const;

private:
  std::string	m_fileName;
  int		m_errNo;
};

// thrown by fromFile()
class File2Big : public TzError {
public:
  File2Big(std::string_view fileName) : m_fileName{fileName} { }
  void print_(std::ostream &s) const {
    s << '"' << m_fileName << "\" file too big";
  }
private:
  std::string	m_fileName;
};

} // TzCfError

class TzAPI TzCf {
  TzCf(const TzCf &) = delete;
  TzCf &operator =(const TzCf &) = delete;

public:
  using Ref = std::shared_ptr<TzCf>;
  using StrArray = std::vector<std::string>;
  using Data = std::variant<std::monostate, std::string, StrArray, Ref>;

  TzCf() = default;
  ~TzCf();

  static Ref make() { return std::make_shared<TzCf>(); }

  // parse command line arguments, returns the number of positional args
  unsigned fromArgs(const TzOpt *options, const StrArray &args);
  static StrArray args(int argc, char **argv);

  // parse configuration text; fileName is used in error messages
  void fromString(std::string_view in, std::string_view fileName = {});
  void fromFile(const std::string &fileName);

  // values

  template <bool Required = false>
  std::string_view get(std::string_view key) const {
    auto data = find(key);
    if (data)
      if (auto s = std::get_if<std::string>(data)) return *s;
    if constexpr (Required) throw TzCfError::Required{this, key};
    return {};
  }
  std::string get(std::string_view key, std::string_view deflt) const {
    auto data = find(key);
    if (data)
      if (auto s = std::get_if<std::string>(data)) return *s;
    return std::string{deflt};
  }

  template <bool Required = false>
  bool getBool(std::string_view key, bool deflt = false) const {
    return scanBool(key, get<Required>(key), deflt);
  }

  template <bool Required = false>
  int getInt(std::string_view key,
      int minimum, int maximum, int deflt = 0) const {
    return scanInt(key, get<Required>(key), minimum, maximum, deflt);
  }
  template <bool Required = false>
  int64_t getInt64(std::string_view key,
      int64_t minimum, int64_t maximum, int64_t deflt = 0) const {
    return scanInt(key, get<Required>(key), minimum, maximum, deflt);
  }

  template <bool Required = false>
  const StrArray *getStrArray(std::string_view key) const {
    auto data = find(key);
    if (data)
      if (auto a = std::get_if<StrArray>(data)) return a;
    if constexpr (Required) throw TzCfError::Required{this, key};
    return nullptr;
  }

  template <bool Required = false>
  Ref getCf(std::string_view key) const {
    auto data = find(key);
    if (data)
      if (auto cf = std::get_if<Ref>(data)) return *cf;
    if constexpr (Required) throw TzCfError::Required{this, key};
    return nullptr;
  }

  void set(std::string_view key, std::string value);
  void setStrArray(std::string_view key, StrArray values);
  // returns the (new or existing) nested scope
  Ref mkCf(std::string_view key);
  void setCf(std::string_view key, Ref cf);
  void unset(std::string_view key);

  bool exists(std::string_view key) const { return find(key); }

  // merge all values from cf, recursing into nested scopes
  void merge(const TzCf &cf);

  // l(std::string_view key, const Data &data) for each immediate child
  template <typename L> void all(L l) const {
    for (const auto &[key, data] : m_tree) l(std::string_view{key}, data);
  }
  unsigned count() const { return m_tree.size(); }

  // dotted path from the root scope
  std::string fullKey(std::string_view key) const;

  void print(std::ostream &s, unsigned indent = 0) const;
  std::string toString() const;

  friend std::ostream &operator <<(std::ostream &s, const TzCf &cf) {
    cf.print(s);
    return s;
  }

  // "yes", "no", "true", "false", "on", "off", "y", "n", "1", "0"
  // case-insensitive; throws BadBool
  bool scanBool(std::string_view key, std::string_view value,
      bool deflt) const;
  // throws Range
  int64_t scanInt(std::string_view key, std::string_view value,
      int64_t minimum, int64_t maximum, int64_t deflt) const;

private:
  const Data *find(std::string_view key) const;

  // resolve all but the last component of a dotted key
  const TzCf *scope(std::string_view &key) const;
  TzCf *mkScope(std::string_view &key);

  void fromArg(std::string_view key, int type, std::string_view value);

  using Tree = std::map<std::string, Data, std::less<>>;

  TzCf			*m_parent = nullptr;	// cleared by parent dtor
  std::string		m_key;		// key in parent
  Tree			m_tree;
};

#endif /* TzCf_HH */
