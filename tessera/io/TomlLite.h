#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Reader for the TOML subset used by elements files: table headers, dotted
// keys, basic and literal strings, integers (dec/hex/oct/bin), floats,
// booleans, inline tables and comments. Arrays and multi-line strings are
// rejected. Key order is preserved.
namespace Tessera::TomlLite {

struct Value;
using Table = std::vector<std::pair<std::string, Value>>;

struct Value final {
  using Storage =
      std::variant<std::monostate, bool, int64_t, double, std::string, Table>;
  Storage v;

  Value() = default;
  Value(bool b) : v(b) {}
  Value(int n) : v(int64_t(n)) {}
  Value(int64_t n) : v(n) {}
  Value(double n) : v(n) {}
  Value(const char *s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Table t) : v(std::move(t)) {}

  bool isNone() const { return std::holds_alternative<std::monostate>(v); }
  bool isBool() const { return std::holds_alternative<bool>(v); }
  bool isInt() const { return std::holds_alternative<int64_t>(v); }
  bool isFloat() const { return std::holds_alternative<double>(v); }
  bool isString() const { return std::holds_alternative<std::string>(v); }
  bool isTable() const { return std::holds_alternative<Table>(v); }

  const Table &asTable() const;
  const std::string &asString() const;
  int64_t asInt(int64_t def = 0) const;
  double asFloat(double def = 0.0) const; // ints convert
  bool asBool(bool def = false) const;

  const Value *get(std::string_view key) const;
  Value *get(std::string_view key);
  // Insert or replace; turns a non-table value into an empty table first.
  Value &set(std::string key, Value value);
};

struct ParseError final {
  size_t line = 0; // 1-based
  std::string message;
};

bool parse(std::string_view src, Value &out, ParseError &err);

// Key as written in a header or assignment: bare when possible.
std::string formatKey(std::string_view key);
// Basic string literal with escapes.
std::string formatString(std::string_view s);

} // namespace Tessera::TomlLite
