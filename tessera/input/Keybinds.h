#pragma once

#include "InputState.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Tessera {

enum class KeyMod : uint8_t {
  None = 0,
  Ctrl = 1 << 0,
  Shift = 1 << 1,
  Alt = 1 << 2,
};

inline KeyMod operator|(KeyMod a, KeyMod b) {
  return (KeyMod)((uint8_t)a | (uint8_t)b);
}

inline bool hasMod(KeyMod set, KeyMod v) {
  return ((uint8_t)set & (uint8_t)v) != 0;
}

// Modifiers held right now; left and right variants are the same modifier.
KeyMod heldMods(const InputState &input);

const char *keyName(Key k);

// One key plus modifiers, fired on the press edge of the key.
struct KeyChord final {
  Key key = Key::Unknown;
  KeyMod mods = KeyMod::None;
  // Held modifiers must equal mods and no other keyboard key may be down.
  bool exact = true;

  bool matches(const InputState &input) const;
  std::string label() const; // "Ctrl+S"
};

struct Keybind final {
  std::string id;
  KeyChord chord;
  int priority = 0;
  std::function<bool()> enabled;
  std::function<void()> action;
};

// Application shortcuts (Ctrl+S and friends). Camera keys go through
// NavBindings instead.
class KeybindManager final {
public:
  void add(Keybind kb);
  void clear() { m_binds.clear(); }

  // Runs the highest-priority enabled bind whose chord matches and returns it.
  const Keybind *process(const InputState &input) const;

  const Keybind *find(std::string_view id) const;
  size_t size() const { return m_binds.size(); }

private:
  std::vector<Keybind> m_binds;
};

} // namespace Tessera
