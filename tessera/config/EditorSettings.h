#pragma once

#include "math/Vector2.h"
#include "view/Camera.h"

#include <expected>
#include <string>
#include <unordered_map>

namespace Tessera {

struct EditorFiles final {
  std::string elements = "elements.toml";
  std::string images = "elements"; // table images, relative to cwd
  std::string icons = "elements/icons";
};

struct EditorWindow final {
  int width = 1366;
  int height = 768;
  bool vsync = true;
};

// Where the previous session left off.
struct EditorSessionState final {
  std::string table = "normal";
  Vector2 camera{};
  float zoom = 1.0f;
};

struct EditorSettings final {
  EditorFiles files{};
  EditorWindow window{};
  CameraTuning camera{};
  EditorSessionState session{};
};

// key=value text file; unknown keys are ignored and bad values keep their
// defaults.
struct EditorSettingsIO final {
  static std::expected<void, std::string> save(const std::string &path,
                                               const EditorSettings &s);
  static std::expected<void, std::string> load(const std::string &path,
                                               EditorSettings &out);

private:
  static std::unordered_map<std::string, std::string>
  parseKV(const std::string &text);
  static std::string trim(std::string v);

  static bool toBool(const std::string &v, bool def);
  static int toInt(const std::string &v, int def);
  static float toFloat(const std::string &v, float def);
};

} // namespace Tessera
