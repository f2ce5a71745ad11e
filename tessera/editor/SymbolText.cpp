#include "SymbolText.h"

#include <array>
#include <utility>

namespace Tessera {

using Pair = std::pair<std::string_view, std::string_view>; // stored, ascii

static constexpr std::array<Pair, 12> kPairs = {{
    {"₀", "0"},
    {"₁", "1"},
    {"₂", "2"},
    {"₃", "3"},
    {"₄", "4"},
    {"₅", "5"},
    {"₆", "6"},
    {"₇", "7"},
    {"₈", "8"},
    {"₉", "9"},
    {"•", "+"},
    {"×", "@"},
}};

static void replaceAll(std::string &s, std::string_view from,
                       std::string_view to) {
  if (from.empty())
    return;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string symbolToEditable(std::string_view stored) {
  std::string s(stored);
  for (const auto &[uni, ascii] : kPairs)
    replaceAll(s, uni, ascii);
  return s;
}

std::string symbolFromEditable(std::string_view edited) {
  std::string s(edited);
  for (const auto &[uni, ascii] : kPairs)
    replaceAll(s, ascii, uni);
  return s;
}

} // namespace Tessera
