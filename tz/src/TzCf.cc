//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// application configuration

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <charconv>
#include <sstream>
#include <tuple>
#include <type_traits>

#include <tzlib/TzCf.hh>
#include <tzlib/TzRegex.hh>

TzCfError::Required::Required(const TzCf *cf, std::string_view key) :
    m_key{cf ? cf->fullKey(key) : std::string{key}} { }

TzCfError::Range::Range(const TzCf *cf, std::string_view key,
    int64_t minimum, int64_t maximum, std::string value) :
  m_key{cf ? cf->fullKey(key) : std::string{key}},
  m_minimum{minimum}, m_maximum{maximum}, m_value{std::move(value)} { }

void TzCfError::Syntax::print_(std::ostream &s) const
{
  if (!m_fileName.empty())
    s << '"' << m_fileName << "\":" << m_line << " syntax error";
  else
    s << "syntax error at line " << m_line;
  s << " near '";
  if (m_ch >= 0x20 && m_ch < 0x7f)
    s << m_ch;
  else {
    static const char hex[] = "0123456789abcdef";
    unsigned c = static_cast<unsigned>(m_ch) & 0xff;
    s << "\\x" << hex[c>>4] << hex[c & 0xf];
  }
  s << '\'';
}

void TzCfError::FileOpenError::print_(std::ostream &s) const
{
  s << '"' << m_fileName << "\" " << strerror(m_errNo);
}

namespace {

// returns {value, length consumed}; a length of 0 implies no value
std::tuple<std::string, unsigned> scanString(
    std::string_view in, unsigned off)
{
  unsigned n = in.length();

  if (off >= n) return {std::string{}, 0U};

  const auto &fileUnquoted = TzREGEX("\G[^\\\"\s{}\[\],#]+");
  const auto &fileQuoted = TzREGEX("\G\\(.)", PCRE_UTF8 | PCRE_DOTALL);
  const auto &fileDblQuote = TzREGEX("\G\"");
  const auto &fileDblUnquoted = TzREGEX("\G[^\\\"]+");

  std::string value;
  TzRegex::Captures c;
  unsigned off_ = off;

  while (off < n) {
    if (fileUnquoted.m(in, c, off)) {
      off += c[1].length();
      value += c[1];
      continue;
    }
    if (fileQuoted.m(in, c, off)) {
      off += c[1].length();
      value += c[2];
      continue;
    }
    if (fileDblQuote.m(in, c, off)) {
      off += c[1].length();
      bool closed = false;
      while (off < n) {
	if (fileDblUnquoted.m(in, c, off)) {
	  off += c[1].length();
	  value += c[1];
	  continue;
	}
	if (fileQuoted.m(in, c, off)) {
	  off += c[1].length();
	  value += c[2];
	  continue;
	}
	++off; // closing "
	closed = true;
	break;
      }
      if (!closed) return {std::string{}, 0U};
      continue;
    }
    break;
  }
  return {std::move(value), off - off_};
}

// command line values - backslash escapes only, terminated by comma
// when splitting arrays
std::tuple<std::string, unsigned> scanArg(
    std::string_view in, unsigned off, bool array)
{
  unsigned n = in.length();
  std::string value;
  unsigned off_ = off;
  while (off < n) {
    char c = in[off];
    if (c == '\\' && off + 1 < n) {
      value += in[off + 1];
      off += 2;
      continue;
    }
    if (array && c == ',') break;
    value += c;
    ++off;
  }
  return {std::move(value), off - off_};
}

std::string quote(std::string_view in)
{
  const auto &unquoted = TzREGEX("\A[^\\\"\s{}\[\],#]+\z");
  if (unquoted.m(in)) return std::string{in};
  std::string out;
  out.reserve(in.length() + 2);
  out += '"';
  for (char c : in) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

bool icmp(std::string_view l, std::string_view r)
{
  if (l.length() != r.length()) return false;
  for (unsigned i = 0, n = l.length(); i < n; i++)
    if (tolower(static_cast<unsigned char>(l[i])) != r[i]) return false;
  return true;
}

} // namespace

TzCf::~TzCf()
{
  for (auto &[key, data] : m_tree)
    if (auto cf = std::get_if<Ref>(&data))
      if (*cf && (*cf)->m_parent == this) (*cf)->m_parent = nullptr;
}

TzCf::StrArray TzCf::args(int argc, char **argv)
{
  if (TzUnlikely(argc < 0)) return {};
  StrArray args;
  args.reserve(argc);
  for (unsigned i = 0; i < unsigned(argc); i++)
    args.emplace_back(argv[i]);
  return args;
}

namespace {

const TzOpt *findOption(const TzOpt *options, std::string_view name)
{
  if (!options) return nullptr;
  for (unsigned i = 0; options[i].long_; i++) {
    if (name.length() == 1 && options[i].short_ == name[0])
      return &options[i];
    if (name == options[i].long_) return &options[i];
  }
  return nullptr;
}

} // namespace

unsigned TzCf::fromArgs(const TzOpt *options, const StrArray &args)
{
  unsigned i, j, n, l, p;
  const auto &argShort = TzREGEX("^-(\w+)$");		// -a, -abc
  const auto &argLongFlag = TzREGEX("^--([\w\-]+)$");	// --arg
  const auto &argLongValue = TzREGEX("^--([\w\-]+)=");	// --arg=val
  TzRegex::Captures c;
  std::string_view cmd = args.empty() ? std::string_view{} : args[0];

  p = 0;
  l = args.size();
  for (i = 0; i < l; i = n) {
    n = i + 1;
    if (argShort.m(args[i], c)) {
      std::string_view shorts = c[2];
      unsigned m = shorts.length();
      for (j = 0; j < m; j++) {
	auto shortOpt = shorts.substr(j, 1);
	auto option = findOption(options, shortOpt);
	if (!option) throw TzCfError::Usage{cmd, shortOpt};
	if (option->type == TzOptType::Flag) {
	  fromArg(option->key, TzOptType::Flag, "1");
	} else {
	  if (n == l) throw TzCfError::Usage{cmd, shortOpt};
	  std::string_view value = args[n];
	  // leading "\-" passes a value starting with '-'
	  if (value.length() > 1 && value[0] == '\\' && value[1] == '-')
	    value.remove_prefix(1);
	  fromArg(option->key, option->type, value);
	  n++;
	}
      }
    } else if (argLongFlag.m(args[i], c)) {
      std::string_view longOpt = c[2];
      auto option = findOption(options, longOpt);
      if (!option || option->type != TzOptType::Flag)
	throw TzCfError::Usage{cmd, longOpt};
      fromArg(option->key, TzOptType::Flag, "1");
    } else if (argLongValue.m(args[i], c)) {
      std::string_view longOpt = c[2];
      auto option = findOption(options, longOpt);
      if (!option || option->type == TzOptType::Flag)
	throw TzCfError::Usage{cmd, longOpt};
      fromArg(option->key, option->type, c[3]);
    } else {
      fromArg(std::to_string(p++), TzOptType::Param, args[i]);
    }
  }
  m_tree["#"] = std::to_string(p);
  return p;
}

void TzCf::fromArg(std::string_view key, int type, std::string_view in)
{
  switch (type) {
    case TzOptType::Flag:
    case TzOptType::Param: {
      auto [value, o] = scanArg(in, 0, false);
      set(key, std::move(value));
    } break;
    case TzOptType::Array: {
      StrArray values;
      unsigned off = 0, n = in.length();
      if (off < n) do {
	auto [value, o] = scanArg(in, off, true);
	values.push_back(std::move(value));
	off += o;
	if (off >= n || in[off] != ',') break;
	++off;
      } while (true);
      setStrArray(key, std::move(values));
    } break;
  }
}

void TzCf::fromString(std::string_view in, std::string_view fileName)
{
  unsigned n = in.length();

  if (!n) return;

  const auto &fileSpace = TzREGEX("\G\s+");
  const auto &fileComment = TzREGEX("\G#[^\n]*");

  enum { Key = 0, Value, Elem, Next };

  TzCf *this_ = this;
  std::vector<TzCf *> stack;
  int state = Key;
  std::string key;
  StrArray values;
  TzRegex::Captures c;
  unsigned off = 0;

  for (;;) {
    while (off < n) {
      if (fileSpace.m(in, c, off)) { off += c[1].length(); continue; }
      if (fileComment.m(in, c, off)) { off += c[1].length(); continue; }
      break;
    }
    if (off >= n) break;
    char ch = in[off];
    switch (state) {
      case Key:
	if (ch == '}') {
	  if (stack.empty()) goto syntax;
	  ++off;
	  this_ = stack.back();
	  stack.pop_back();
	  continue;
	}
	{
	  auto [key_, o] = scanString(in, off);
	  if (!o || key_.empty()) goto syntax;
	  key = std::move(key_);
	  off += o;
	}
	state = Value;
	continue;
      case Value:
	if (ch == '[') {
	  ++off;
	  values.clear();
	  state = Elem;
	  continue;
	}
	if (ch == '{') {
	  if (this_->exists(key) && !this_->getCf(key)) goto syntax;
	  ++off;
	  stack.push_back(this_);
	  this_ = this_->mkCf(key).get();
	  state = Key;
	  continue;
	}
	{
	  auto [value, o] = scanString(in, off);
	  if (!o) goto syntax;
	  off += o;
	  this_->set(key, std::move(value));
	}
	state = Key;
	continue;
      case Elem:
	if (ch == ']' && values.empty()) {
	  ++off;
	  this_->setStrArray(key, std::move(values));
	  values = StrArray{};
	  state = Key;
	  continue;
	}
	{
	  auto [value, o] = scanString(in, off);
	  if (!o) goto syntax;
	  off += o;
	  values.push_back(std::move(value));
	}
	state = Next;
	continue;
      case Next:
	if (ch == ',') {
	  ++off;
	  state = Elem;
	  continue;
	}
	if (ch == ']') {
	  ++off;
	  this_->setStrArray(key, std::move(values));
	  values = StrArray{};
	  state = Key;
	  continue;
	}
	goto syntax;
    }
  }
  if (state == Key && stack.empty()) return;
  off = n - 1;

syntax:
  unsigned line = 1 + std::count(in.begin(), in.begin() + off, '\n');
  throw TzCfError::Syntax{line, in[off], fileName};
}

void TzCf::fromFile(const std::string &fileName)
{
  std::unique_ptr<FILE, int (*)(FILE *)> file{
    fopen(fileName.c_str(), "r"), &fclose};
  if (!file) throw TzCfError::FileOpenError{fileName, errno};
  std::string in;
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), file.get())) > 0) {
    if (in.length() + n > TzCfMaxFileSize)
      throw TzCfError::File2Big{fileName};
    in.append(buf, n);
  }
  if (ferror(file.get())) throw TzCfError::FileOpenError{fileName, errno};
  fromString(in, fileName);
}

const TzCf *TzCf::scope(std::string_view &key) const
{
  const TzCf *cf = this;
  std::string_view::size_type i;
  while ((i = key.find('.')) != std::string_view::npos) {
    auto node = cf->m_tree.find(key.substr(0, i));
    if (node == cf->m_tree.end()) return nullptr;
    auto child = std::get_if<Ref>(&node->second);
    if (!child || !*child) return nullptr;
    cf = child->get();
    key.remove_prefix(i + 1);
  }
  return cf;
}

TzCf *TzCf::mkScope(std::string_view &key)
{
  TzCf *cf = this;
  std::string_view::size_type i;
  while ((i = key.find('.')) != std::string_view::npos) {
    cf = cf->mkCf(key.substr(0, i)).get();
    key.remove_prefix(i + 1);
  }
  return cf;
}

const TzCf::Data *TzCf::find(std::string_view key) const
{
  auto cf = scope(key);
  if (!cf) return nullptr;
  auto node = cf->m_tree.find(key);
  if (node == cf->m_tree.end()) return nullptr;
  return &node->second;
}

void TzCf::set(std::string_view key, std::string value)
{
  auto cf = mkScope(key);
  cf->m_tree.insert_or_assign(std::string{key}, std::move(value));
}

void TzCf::setStrArray(std::string_view key, StrArray values)
{
  auto cf = mkScope(key);
  cf->m_tree.insert_or_assign(std::string{key}, std::move(values));
}

TzCf::Ref TzCf::mkCf(std::string_view key)
{
  auto cf = mkScope(key);
  auto node = cf->m_tree.find(key);
  if (node != cf->m_tree.end())
    if (auto child = std::get_if<Ref>(&node->second))
      if (*child) return *child;
  auto child = make();
  cf->setCf(key, child);
  return child;
}

void TzCf::setCf(std::string_view key, Ref child)
{
  auto cf = mkScope(key);
  if (child) {
    child->m_parent = cf;
    child->m_key = key;
  }
  cf->m_tree.insert_or_assign(std::string{key}, std::move(child));
}

void TzCf::unset(std::string_view key)
{
  auto cf = scope(key);
  if (!cf) return;
  auto cf_ = const_cast<TzCf *>(cf);
  auto node = cf_->m_tree.find(key);
  if (node != cf_->m_tree.end()) cf_->m_tree.erase(node);
}

void TzCf::merge(const TzCf &cf)
{
  for (const auto &[key, data] : cf.m_tree) {
    std::visit([this, &key](const auto &v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::string>)
	m_tree.insert_or_assign(key, v);
      else if constexpr (std::is_same_v<T, StrArray>)
	m_tree.insert_or_assign(key, v);
      else if constexpr (std::is_same_v<T, Ref>) {
	if (v) mkCf(key)->merge(*v);
      }
    }, data);
  }
}

std::string TzCf::fullKey(std::string_view key) const
{
  std::string s{key};
  for (auto cf = this; cf->m_parent; cf = cf->m_parent)
    s = cf->m_key + '.' + s;
  return s;
}

void TzCf::print(std::ostream &s, unsigned indent) const
{
  std::string prefix(indent, ' ');
  for (const auto &[key, data] : m_tree) {
    std::visit([&](const auto &v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::string>) {
	s << prefix << quote(key) << ' ' << quote(v) << '\n';
      } else if constexpr (std::is_same_v<T, StrArray>) {
	s << prefix << quote(key) << " [";
	for (unsigned i = 0, n = v.size(); i < n; i++) {
	  if (i) s << ',';
	  s << ' ' << quote(v[i]);
	}
	s << " ]\n";
      } else if constexpr (std::is_same_v<T, Ref>) {
	if (!v) return;
	s << prefix << quote(key) << " {\n";
	v->print(s, indent + 2);
	s << prefix << "}\n";
      }
    }, data);
  }
}

std::string TzCf::toString() const
{
  std::ostringstream s;
  print(s);
  return s.str();
}

bool TzCf::scanBool(
    std::string_view key, std::string_view value, bool deflt) const
{
  if (value.empty()) return deflt;
  static const char *trues[] = { "1", "y", "yes", "true", "on" };
  static const char *falses[] = { "0", "n", "no", "false", "off" };
  for (auto s : trues) if (icmp(value, s)) return true;
  for (auto s : falses) if (icmp(value, s)) return false;
  throw TzCfError::BadBool{fullKey(key), std::string{value}};
}

int64_t TzCf::scanInt(std::string_view key, std::string_view value,
    int64_t minimum, int64_t maximum, int64_t deflt) const
{
  if (value.empty()) return deflt;
  int64_t v = 0;
  auto begin = value.data(), end = begin + value.length();
  if (*begin == '+') ++begin;
  auto [ptr, ec] = std::from_chars(begin, end, v);
  if (ec != std::errc{} || ptr != end || v < minimum || v > maximum)
    throw TzCfError::Range{this, key, minimum, maximum, std::string{value}};
  return v;
}
