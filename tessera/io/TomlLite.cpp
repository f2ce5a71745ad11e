#include "TomlLite.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace Tessera::TomlLite {

static const Table &emptyTable() {
  static Table t{};
  return t;
}
static const std::string &emptyStr() {
  static std::string s{};
  return s;
}

const Table &Value::asTable() const {
  if (!isTable())
    return emptyTable();
  return std::get<Table>(v);
}
const std::string &Value::asString() const {
  if (!isString())
    return emptyStr();
  return std::get<std::string>(v);
}
int64_t Value::asInt(int64_t def) const {
  if (!isInt())
    return def;
  return std::get<int64_t>(v);
}
double Value::asFloat(double def) const {
  if (isInt())
    return double(std::get<int64_t>(v));
  if (!isFloat())
    return def;
  return std::get<double>(v);
}
bool Value::asBool(bool def) const {
  if (!isBool())
    return def;
  return std::get<bool>(v);
}

const Value *Value::get(std::string_view key) const {
  if (!isTable())
    return nullptr;
  for (const auto &kv : std::get<Table>(v)) {
    if (kv.first == key)
      return &kv.second;
  }
  return nullptr;
}
Value *Value::get(std::string_view key) {
  if (!isTable())
    return nullptr;
  for (auto &kv : std::get<Table>(v)) {
    if (kv.first == key)
      return &kv.second;
  }
  return nullptr;
}

Value &Value::set(std::string key, Value value) {
  if (!isTable())
    v = Table{};
  if (Value *existing = get(key)) {
    *existing = std::move(value);
    return *existing;
  }
  auto &t = std::get<Table>(v);
  t.emplace_back(std::move(key), std::move(value));
  return t.back().second;
}

// ---------------- Parser ----------------

struct P final {
  std::string_view s;
  size_t i = 0;
  size_t line = 1;

  char peek(size_t ahead = 0) const {
    return (i + ahead < s.size()) ? s[i + ahead] : '\0';
  }
  char get() { return (i < s.size()) ? s[i++] : '\0'; }
  bool eof() const { return i >= s.size(); }

  void skipWS() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t'))
      ++i;
  }

  void skipComment() {
    if (peek() != '#')
      return;
    while (i < s.size() && s[i] != '\n')
      ++i;
  }
};

static bool fail(P &p, ParseError &err, std::string msg) {
  err.line = p.line;
  err.message = std::move(msg);
  return false;
}

static bool isBareKeyChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back((char)cp);
  } else if (cp < 0x800) {
    out.push_back((char)(0xC0 | (cp >> 6)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back((char)(0xE0 | (cp >> 12)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  } else {
    out.push_back((char)(0xF0 | (cp >> 18)));
    out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back((char)(0x80 | (cp & 0x3F)));
  }
}

static bool parseHexDigits(P &p, int count, uint32_t &out, ParseError &err) {
  out = 0;
  for (int k = 0; k < count; ++k) {
    const char c = p.get();
    uint32_t d = 0;
    if (c >= '0' && c <= '9')
      d = uint32_t(c - '0');
    else if (c >= 'a' && c <= 'f')
      d = uint32_t(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      d = uint32_t(c - 'A' + 10);
    else
      return fail(p, err, "bad unicode escape");
    out = (out << 4) | d;
  }
  return true;
}

static bool parseBasicString(P &p, std::string &out, ParseError &err) {
  if (p.get() != '"')
    return fail(p, err, "expected '\"' to start string");
  if (p.peek() == '"' && p.peek(1) == '"')
    return fail(p, err, "multi-line strings are not supported");

  std::string r;
  while (true) {
    const char c = p.get();
    if (c == '\0' || c == '\n')
      return fail(p, err, "unterminated string");
    if (c == '"')
      break;
    if (c != '\\') {
      r.push_back(c);
      continue;
    }
    const char e = p.get();
    switch (e) {
    case 'b':
      r.push_back('\b');
      break;
    case 't':
      r.push_back('\t');
      break;
    case 'n':
      r.push_back('\n');
      break;
    case 'f':
      r.push_back('\f');
      break;
    case 'r':
      r.push_back('\r');
      break;
    case '"':
      r.push_back('"');
      break;
    case '\\':
      r.push_back('\\');
      break;
    case 'u':
    case 'U': {
      uint32_t cp = 0;
      if (!parseHexDigits(p, e == 'u' ? 4 : 8, cp, err))
        return false;
      appendUtf8(r, cp);
      break;
    }
    default:
      return fail(p, err, "bad escape");
    }
  }
  out = std::move(r);
  return true;
}

static bool parseLiteralString(P &p, std::string &out, ParseError &err) {
  if (p.get() != '\'')
    return fail(p, err, "expected '\\'' to start string");
  if (p.peek() == '\'' && p.peek(1) == '\'')
    return fail(p, err, "multi-line strings are not supported");

  std::string r;
  while (true) {
    const char c = p.get();
    if (c == '\0' || c == '\n')
      return fail(p, err, "unterminated string");
    if (c == '\'')
      break;
    r.push_back(c);
  }
  out = std::move(r);
  return true;
}

static bool parseSimpleKey(P &p, std::string &out, ParseError &err) {
  const char c = p.peek();
  if (c == '"')
    return parseBasicString(p, out, err);
  if (c == '\'')
    return parseLiteralString(p, out, err);

  const size_t start = p.i;
  while (isBareKeyChar(p.peek()))
    ++p.i;
  if (p.i == start)
    return fail(p, err, "expected key");
  out.assign(p.s.substr(start, p.i - start));
  return true;
}

static bool parseKeyPath(P &p, std::vector<std::string> &out,
                         ParseError &err) {
  out.clear();
  while (true) {
    p.skipWS();
    std::string k;
    if (!parseSimpleKey(p, k, err))
      return false;
    out.push_back(std::move(k));
    p.skipWS();
    if (p.peek() != '.')
      return true;
    ++p.i;
  }
}

// Walk/create nested tables along path, starting at base.
static Value *descend(P &p, Value *base, const std::vector<std::string> &path,
                      size_t count, ParseError &err) {
  Value *cur = base;
  for (size_t k = 0; k < count; ++k) {
    Value *child = cur->get(path[k]);
    if (!child) {
      child = &cur->set(path[k], Table{});
    } else if (!child->isTable()) {
      fail(p, err, "key '" + path[k] + "' is not a table");
      return nullptr;
    }
    cur = child;
  }
  return cur;
}

static bool parseValue(P &p, Value &out, ParseError &err);

static bool isValueEnd(char c) {
  return c == '\0' || c == ' ' || c == '\t' || c == '\r' || c == '\n' ||
         c == ',' || c == '}' || c == '#';
}

static bool parseNumber(P &p, Value &out, ParseError &err) {
  const size_t start = p.i;
  while (!isValueEnd(p.peek()))
    ++p.i;

  std::string tok;
  for (char c : p.s.substr(start, p.i - start)) {
    if (c != '_')
      tok.push_back(c);
  }
  if (tok.empty())
    return fail(p, err, "expected value");

  std::string body = tok;
  bool negative = false;
  if (body[0] == '+' || body[0] == '-') {
    negative = body[0] == '-';
    body.erase(0, 1);
  }

  if (body == "inf" || body == "nan") {
    out = Value(std::strtod(tok.c_str(), nullptr));
    return true;
  }

  int base = 10;
  if (body.size() > 2 && body[0] == '0') {
    if (body[1] == 'x')
      base = 16;
    else if (body[1] == 'o')
      base = 8;
    else if (body[1] == 'b')
      base = 2;
    if (base != 10)
      body.erase(0, 2);
  }

  const bool isFloat = base == 10 && body.find_first_of(".eE") !=
                                         std::string::npos;
  errno = 0;
  char *end = nullptr;
  if (isFloat) {
    const double d = std::strtod(tok.c_str(), &end);
    if (end == tok.c_str() || *end != '\0' || errno == ERANGE)
      return fail(p, err, "invalid float '" + tok + "'");
    out = Value(d);
    return true;
  }

  const long long n = std::strtoll(body.c_str(), &end, base);
  if (body.empty() || *end != '\0' || errno == ERANGE)
    return fail(p, err, "invalid value '" + tok + "'");
  out = Value(int64_t(negative ? -n : n));
  return true;
}

static bool parseInlineTable(P &p, Value &out, ParseError &err) {
  ++p.i; // '{'
  out = Value(Table{});
  p.skipWS();
  if (p.peek() == '}') {
    ++p.i;
    return true;
  }

  std::vector<std::string> path;
  while (true) {
    if (!parseKeyPath(p, path, err))
      return false;
    p.skipWS();
    if (p.get() != '=')
      return fail(p, err, "expected '=' in inline table");
    p.skipWS();

    Value v;
    if (!parseValue(p, v, err))
      return false;
    Value *parent = descend(p, &out, path, path.size() - 1, err);
    if (!parent)
      return false;
    if (parent->get(path.back()))
      return fail(p, err, "duplicate key '" + path.back() + "'");
    parent->set(path.back(), std::move(v));

    p.skipWS();
    const char c = p.get();
    if (c == '}')
      return true;
    if (c != ',')
      return fail(p, err, "expected ',' or '}' in inline table");
    p.skipWS();
  }
}

static bool parseValue(P &p, Value &out, ParseError &err) {
  const char c = p.peek();
  if (c == '"') {
    std::string s;
    if (!parseBasicString(p, s, err))
      return false;
    out = Value(std::move(s));
    return true;
  }
  if (c == '\'') {
    std::string s;
    if (!parseLiteralString(p, s, err))
      return false;
    out = Value(std::move(s));
    return true;
  }
  if (c == '{')
    return parseInlineTable(p, out, err);
  if (c == '[')
    return fail(p, err, "arrays are not supported");
  if (p.s.substr(p.i, 4) == "true" && isValueEnd(p.peek(4))) {
    p.i += 4;
    out = Value(true);
    return true;
  }
  if (p.s.substr(p.i, 5) == "false" && isValueEnd(p.peek(5))) {
    p.i += 5;
    out = Value(false);
    return true;
  }
  return parseNumber(p, out, err);
}

static bool expectLineEnd(P &p, ParseError &err) {
  p.skipWS();
  p.skipComment();
  if (p.peek() == '\r')
    ++p.i;
  const char c = p.peek();
  if (c == '\0')
    return true;
  if (c != '\n')
    return fail(p, err, "expected end of line");
  ++p.i;
  ++p.line;
  return true;
}

bool parse(std::string_view src, Value &out, ParseError &err) {
  P p{src};
  Value root = Value(Table{});
  Value *current = &root;
  std::vector<std::string> path;

  while (!p.eof()) {
    p.skipWS();
    const char c = p.peek();
    if (c == '#') {
      p.skipComment();
      continue;
    }
    if (c == '\r' || c == '\n') {
      if (!expectLineEnd(p, err))
        return false;
      continue;
    }
    if (c == '\0')
      break;

    if (c == '[') {
      ++p.i;
      if (p.peek() == '[')
        return fail(p, err, "arrays of tables are not supported");
      if (!parseKeyPath(p, path, err))
        return false;
      p.skipWS();
      if (p.get() != ']')
        return fail(p, err, "expected ']' after table name");
      current = descend(p, &root, path, path.size(), err);
      if (!current)
        return false;
      if (!expectLineEnd(p, err))
        return false;
      continue;
    }

    if (!parseKeyPath(p, path, err))
      return false;
    p.skipWS();
    if (p.get() != '=')
      return fail(p, err, "expected '=' after key");
    p.skipWS();

    Value v;
    if (!parseValue(p, v, err))
      return false;
    Value *parent = descend(p, current, path, path.size() - 1, err);
    if (!parent)
      return false;
    if (parent->get(path.back()))
      return fail(p, err, "duplicate key '" + path.back() + "'");
    parent->set(path.back(), std::move(v));

    if (!expectLineEnd(p, err))
      return false;
  }

  out = std::move(root);
  return true;
}

// ---------------- Writer helpers ----------------

std::string formatKey(std::string_view key) {
  bool bare = !key.empty();
  for (char c : key) {
    if (!isBareKeyChar(c)) {
      bare = false;
      break;
    }
  }
  return bare ? std::string(key) : formatString(key);
}

std::string formatString(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  o.push_back('"');
  for (char c : s) {
    switch (c) {
    case '"':
      o += "\\\"";
      break;
    case '\\':
      o += "\\\\";
      break;
    case '\n':
      o += "\\n";
      break;
    case '\t':
      o += "\\t";
      break;
    case '\r':
      o += "\\r";
      break;
    case '\b':
      o += "\\b";
      break;
    case '\f':
      o += "\\f";
      break;
    default:
      if ((unsigned char)c < 0x20 || c == 0x7F) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04X", (unsigned)(unsigned char)c);
        o += buf;
      } else {
        o.push_back(c);
      }
    }
  }
  o.push_back('"');
  return o;
}

} // namespace Tessera::TomlLite
