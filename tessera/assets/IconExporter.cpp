#include "IconExporter.h"

#include "ImageIO.h"
#include "core/Log.h"

#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace Tessera {

bool IconExporter::isSafeFileName(const std::string &name) {
  if (name.empty() || name == "." || name == "..")
    return false;
  for (unsigned char c : name) {
    if (c < 0x20 || c == '/' || c == '\\' || c == ':')
      return false;
  }
  return true;
}

std::expected<IconExportResult, std::string>
IconExporter::exportTable(const Table &table, const Image &tableImage,
                          const std::string &iconsDir) {
  if (tableImage.empty())
    return std::unexpected("Table '" + table.name + "' has no image loaded");

  try {
    const std::filesystem::path dir = iconsDir;
    std::filesystem::create_directories(dir);

    IconExportResult result{};
    nlohmann::json icons = nlohmann::json::object();

    for (const Element &e : table.elements.elements()) {
      const std::string &name = e.info.name;
      if (!isSafeFileName(name)) {
        Log::Warn("Skipping icon for element with unusable name '{}'", name);
        ++result.skipped;
        continue;
      }

      const Image icon = sliceIcon(tableImage, e.position);
      const std::string file = name + ".png";
      if (auto ok = ImageIO::savePng((dir / file).string(), icon); !ok)
        return std::unexpected(ok.error());

      nlohmann::json r;
      r["x"] = (int)std::floor(e.position.x) - ElementMargin;
      r["y"] = (int)std::floor(e.position.y) - ElementMargin;
      r["w"] = icon.width();
      r["h"] = icon.height();
      r["file"] = file;
      icons[name] = std::move(r);
      ++result.written;
    }

    nlohmann::json j;
    j["table"] = table.name;
    j["icons"] = std::move(icons);

    const std::filesystem::path manifest = dir / "icons.json";
    std::ofstream f(manifest, std::ios::binary);
    if (!f)
      return std::unexpected("Failed to open " + manifest.string());
    const std::string txt = j.dump(2);
    f.write(txt.data(), (std::streamsize)txt.size());

    Log::Info("Exported {} icons from '{}' to {}", result.written, table.name,
              dir.string());
    return result;
  } catch (const std::exception &e) {
    return std::unexpected(std::string("IconExporter: ") + e.what());
  }
}

} // namespace Tessera
