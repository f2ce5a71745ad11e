#include "EditorSettings.h"

#include "core/Log.h"

#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Tessera {

static void put(std::ostringstream &o, const char *k, bool v) {
  o << k << "=" << (v ? "1" : "0") << "\n";
}
static void put(std::ostringstream &o, const char *k, int v) {
  o << k << "=" << v << "\n";
}
static void put(std::ostringstream &o, const char *k, float v) {
  o << k << "=" << v << "\n";
}
static void put(std::ostringstream &o, const char *k, const std::string &v) {
  o << k << "=" << v << "\n";
}

// Out-of-range tuning would break the camera invariants; keep the old value.
static float checked(const char *key, float v, float def, bool ok) {
  if (ok)
    return v;
  Log::Warn("Setting '{}' = {} is out of range, using {}", key, v, def);
  return def;
}

std::expected<void, std::string>
EditorSettingsIO::save(const std::string &path, const EditorSettings &s) {
  try {
    std::filesystem::path p = std::filesystem::absolute(path);
    std::filesystem::create_directories(p.parent_path());

    std::ostringstream o;
    o.precision(9);

    put(o, "files.elements", s.files.elements);
    put(o, "files.images", s.files.images);
    put(o, "files.icons", s.files.icons);

    put(o, "window.width", s.window.width);
    put(o, "window.height", s.window.height);
    put(o, "window.vsync", s.window.vsync);

    put(o, "camera.speed", s.camera.speed);
    put(o, "camera.damping", s.camera.damping);
    put(o, "camera.zoomBase", s.camera.zoomBase);
    put(o, "camera.zoomRate", s.camera.zoomRate);
    put(o, "camera.easingDuration", s.camera.easingDuration);

    put(o, "session.table", s.session.table);
    put(o, "session.camX", s.session.camera.x);
    put(o, "session.camY", s.session.camera.y);
    put(o, "session.zoom", s.session.zoom);

    std::ofstream f(p, std::ios::binary);
    if (!f.is_open())
      return std::unexpected("Failed to open settings for write: " +
                             p.string());
    f << o.str();
    return {};
  } catch (const std::exception &e) {
    return std::unexpected(std::string("EditorSettingsIO::save: ") + e.what());
  }
}

std::expected<void, std::string>
EditorSettingsIO::load(const std::string &path, EditorSettings &out) {
  try {
    std::filesystem::path p = std::filesystem::absolute(path);
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) {
      // Not an error; first run.
      return {};
    }

    std::stringstream buf;
    buf << f.rdbuf();

    auto kv = parseKV(buf.str());

    auto get = [&](const char *k) -> std::string {
      auto it = kv.find(k);
      if (it == kv.end())
        return {};
      return it->second;
    };
    auto getStr = [&](const char *k, const std::string &def) {
      const std::string v = get(k);
      return v.empty() ? def : v;
    };

    out.files.elements = getStr("files.elements", out.files.elements);
    out.files.images = getStr("files.images", out.files.images);
    out.files.icons = getStr("files.icons", out.files.icons);

    out.window.width = toInt(get("window.width"), out.window.width);
    out.window.height = toInt(get("window.height"), out.window.height);
    out.window.vsync = toBool(get("window.vsync"), out.window.vsync);
    if (out.window.width <= 0)
      out.window.width = EditorWindow{}.width;
    if (out.window.height <= 0)
      out.window.height = EditorWindow{}.height;

    CameraTuning &cam = out.camera;
    const CameraTuning old = cam;
    float v = toFloat(get("camera.speed"), old.speed);
    cam.speed =
        checked("camera.speed", v, old.speed, v > 0.0f && std::isfinite(v));
    v = toFloat(get("camera.damping"), old.damping);
    cam.damping =
        checked("camera.damping", v, old.damping, v > 0.0f && v <= 1.0f);
    v = toFloat(get("camera.zoomBase"), old.zoomBase);
    cam.zoomBase = checked("camera.zoomBase", v, old.zoomBase,
                           v > 1.0f && std::isfinite(v));
    v = toFloat(get("camera.zoomRate"), old.zoomRate);
    cam.zoomRate =
        checked("camera.zoomRate", v, old.zoomRate, v > 0.0f && v < 1.0f);
    v = toFloat(get("camera.easingDuration"), old.easingDuration);
    cam.easingDuration = checked("camera.easingDuration", v,
                                 old.easingDuration,
                                 v > 0.0f && std::isfinite(v));

    out.session.table = getStr("session.table", out.session.table);
    v = toFloat(get("session.camX"), out.session.camera.x);
    out.session.camera.x =
        checked("session.camX", v, out.session.camera.x, std::isfinite(v));
    v = toFloat(get("session.camY"), out.session.camera.y);
    out.session.camera.y =
        checked("session.camY", v, out.session.camera.y, std::isfinite(v));
    v = toFloat(get("session.zoom"), out.session.zoom);
    out.session.zoom =
        checked("session.zoom", v, out.session.zoom,
                v > 0.0f && std::isfinite(v));

    return {};
  } catch (const std::exception &e) {
    return std::unexpected(std::string("EditorSettingsIO::load: ") + e.what());
  }
}

std::unordered_map<std::string, std::string>
EditorSettingsIO::parseKV(const std::string &text) {
  std::unordered_map<std::string, std::string> m;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty())
      continue;
    if (line[0] == '#')
      continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string k = trim(line.substr(0, eq));
    std::string v = trim(line.substr(eq + 1));
    if (!k.empty())
      m.insert_or_assign(std::move(k), std::move(v));
  }
  return m;
}

std::string EditorSettingsIO::trim(std::string v) {
  auto isSpace = [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  };
  while (!v.empty() && isSpace((unsigned char)v.front()))
    v.erase(v.begin());
  while (!v.empty() && isSpace((unsigned char)v.back()))
    v.pop_back();
  return v;
}

bool EditorSettingsIO::toBool(const std::string &v, bool def) {
  if (v.empty())
    return def;
  if (v == "1" || v == "true" || v == "True" || v == "TRUE")
    return true;
  if (v == "0" || v == "false" || v == "False" || v == "FALSE")
    return false;
  return def;
}

int EditorSettingsIO::toInt(const std::string &v, int def) {
  if (v.empty())
    return def;
  try {
    return std::stoi(v);
  } catch (const std::exception &) {
    return def;
  }
}

float EditorSettingsIO::toFloat(const std::string &v, float def) {
  if (v.empty())
    return def;
  try {
    return std::stof(v);
  } catch (const std::exception &) {
    return def;
  }
}

} // namespace Tessera
