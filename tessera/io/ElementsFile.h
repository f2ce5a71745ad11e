#pragma once

#include "model/Element.h"
#include "model/Workspace.h"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace Tessera {

struct TableEntry final {
  std::string name;
  std::string imagePath;
};

// In-memory form of an elements file, in file order.
struct ElementsDocument final {
  std::vector<TableEntry> tables;
  std::vector<ElementRecord> elements;
};

// elements.toml reader/writer.
//
//   [tables]
//   normal = "table.png"
//
//   ["Hydrogen"]
//   table = "normal"
//   symbol = "H"
//   pronouns = "they/them"
//   author = "a, b"
//   embed_color = 0xFF0000
//   coordinates = { x = 10, y = 20 }
//   atomic_number = 1
//
// Extras carry `path = "..."` instead of table/coordinates.
struct ElementsFile final {
  static std::expected<ElementsDocument, std::string>
  parse(std::string_view text);
  static std::expected<ElementsDocument, std::string>
  load(const std::string &path);

  static std::string write(const ElementsDocument &doc);
  // Serializes fully before touching the file.
  static std::expected<void, std::string> save(const std::string &path,
                                               const ElementsDocument &doc);
};

// Tables get their elements, extras are kept aside. Canvas sizes are left
// for the image loader to fill in.
void buildWorkspace(const ElementsDocument &doc, Workspace &out);
ElementsDocument captureWorkspace(const Workspace &ws);

std::vector<std::string> splitAuthors(std::string_view joined);
std::string joinAuthors(const std::vector<std::string> &authors);

} // namespace Tessera
