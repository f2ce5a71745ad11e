#pragma once

#include "image/Image.h"
#include "model/Table.h"

#include <expected>
#include <string>

namespace Tessera {

struct IconExportResult final {
  int written = 0;
  int skipped = 0; // names unusable as file names
};

// Writes one PNG per element of a table plus an icons.json manifest:
//
//   { "table": "normal",
//     "icons": { "Hydrogen": { "x": 9, "y": 19, "w": 50, "h": 50,
//                              "file": "Hydrogen.png" } } }
//
// x/y/w/h describe the sliced region in table pixels, margin included.
struct IconExporter final {
  static std::expected<IconExportResult, std::string>
  exportTable(const Table &table, const Image &tableImage,
              const std::string &iconsDir);

  // Element names become file names; path separators and control characters
  // are not allowed.
  static bool isSafeFileName(const std::string &name);
};

} // namespace Tessera
