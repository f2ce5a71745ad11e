#include "Keybinds.h"

#include <algorithm>

namespace Tessera {

static bool isModifierKey(Key k) {
  switch (k) {
  case Key::LeftShift:
  case Key::RightShift:
  case Key::LeftCtrl:
  case Key::RightCtrl:
  case Key::LeftAlt:
  case Key::RightAlt:
    return true;
  default:
    return false;
  }
}

static bool isMouseKey(Key k) {
  return k == Key::MouseLeft || k == Key::MouseRight || k == Key::MouseMiddle;
}

KeyMod heldMods(const InputState &input) {
  KeyMod m = KeyMod::None;
  if (input.isDown(Key::LeftCtrl) || input.isDown(Key::RightCtrl))
    m = m | KeyMod::Ctrl;
  if (input.isDown(Key::LeftShift) || input.isDown(Key::RightShift))
    m = m | KeyMod::Shift;
  if (input.isDown(Key::LeftAlt) || input.isDown(Key::RightAlt))
    m = m | KeyMod::Alt;
  return m;
}

const char *keyName(Key k) {
  switch (k) {
  case Key::W: return "W";
  case Key::A: return "A";
  case Key::S: return "S";
  case Key::D: return "D";
  case Key::ArrowUp: return "Up";
  case Key::ArrowDown: return "Down";
  case Key::ArrowLeft: return "Left";
  case Key::ArrowRight: return "Right";
  case Key::Equal: return "=";
  case Key::Minus: return "-";
  case Key::Comma: return ",";
  case Key::Period: return ".";
  case Key::Slash: return "/";
  case Key::Backslash: return "\\";
  case Key::Enter: return "Enter";
  case Key::Escape: return "Escape";
  case Key::Delete: return "Delete";
  default: return "?";
  }
}

bool KeyChord::matches(const InputState &input) const {
  if (key == Key::Unknown || !input.isPressed(key))
    return false;

  const KeyMod held = heldMods(input);
  for (KeyMod m : {KeyMod::Ctrl, KeyMod::Shift, KeyMod::Alt}) {
    const bool want = hasMod(mods, m);
    if (want && !hasMod(held, m))
      return false;
    if (exact && !want && hasMod(held, m))
      return false;
  }

  if (!exact)
    return true;

  for (uint32_t i = 1; i < InputState::MaxKeys; ++i) {
    const Key k = (Key)i;
    if (k == key || !input.down[i] || isModifierKey(k) || isMouseKey(k))
      continue;
    return false;
  }
  return true;
}

std::string KeyChord::label() const {
  std::string s;
  if (hasMod(mods, KeyMod::Ctrl))
    s += "Ctrl+";
  if (hasMod(mods, KeyMod::Shift))
    s += "Shift+";
  if (hasMod(mods, KeyMod::Alt))
    s += "Alt+";
  s += keyName(key);
  return s;
}

void KeybindManager::add(Keybind kb) {
  m_binds.push_back(std::move(kb));
  std::stable_sort(m_binds.begin(), m_binds.end(),
                   [](const Keybind &a, const Keybind &b) {
                     return a.priority > b.priority;
                   });
}

const Keybind *KeybindManager::process(const InputState &input) const {
  for (const auto &kb : m_binds) {
    if (kb.enabled && !kb.enabled())
      continue;
    if (!kb.chord.matches(input))
      continue;
    if (kb.action)
      kb.action();
    return &kb;
  }
  return nullptr;
}

const Keybind *KeybindManager::find(std::string_view id) const {
  for (const auto &kb : m_binds) {
    if (kb.id == id)
      return &kb;
  }
  return nullptr;
}

} // namespace Tessera
