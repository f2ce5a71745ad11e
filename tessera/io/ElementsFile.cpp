#include "ElementsFile.h"

#include "TomlLite.h"
#include "core/Log.h"

#include <cmath>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Tessera {

namespace Toml = TomlLite;

static constexpr std::string_view TablesKey = "tables";

std::vector<std::string> splitAuthors(std::string_view joined) {
  std::vector<std::string> out;
  if (joined.empty())
    return out;
  size_t start = 0;
  while (true) {
    const size_t sep = joined.find(", ", start);
    if (sep == std::string_view::npos) {
      out.emplace_back(joined.substr(start));
      break;
    }
    out.emplace_back(joined.substr(start, sep - start));
    start = sep + 2;
  }
  return out;
}

std::string joinAuthors(const std::vector<std::string> &authors) {
  std::string out;
  for (size_t i = 0; i < authors.size(); ++i) {
    if (i)
      out += ", ";
    out += authors[i];
  }
  return out;
}

static std::string hexColor(uint32_t rgb) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "0x%06X", (unsigned)(rgb & 0xFFFFFFu));
  return buf;
}

static long long coord(float v) { return (long long)std::floor(v); }

static bool hasTable(const std::vector<TableEntry> &tables,
                     std::string_view name) {
  for (const auto &t : tables) {
    if (t.name == name)
      return true;
  }
  return false;
}

std::expected<ElementsDocument, std::string>
ElementsFile::parse(std::string_view text) {
  Toml::Value root;
  Toml::ParseError perr;
  if (!Toml::parse(text, root, perr))
    return std::unexpected("line " + std::to_string(perr.line) + ": " +
                           perr.message);

  const Toml::Value *tables = root.get(TablesKey);
  if (!tables || !tables->isTable())
    return std::unexpected(std::string("missing [tables] section"));

  ElementsDocument doc{};
  for (const auto &[name, path] : tables->asTable()) {
    if (!path.isString())
      return std::unexpected("table '" + name + "' must map to an image path");
    doc.tables.push_back({name, path.asString()});
  }

  for (const auto &[name, data] : root.asTable()) {
    if (name == TablesKey)
      continue;
    if (!data.isTable())
      return std::unexpected("element '" + name + "' is not a table");

    ElementRecord rec{};
    rec.info.name = name;
    if (const auto *v = data.get("symbol"))
      rec.info.symbol = v->asString();
    if (const auto *v = data.get("pronouns"))
      rec.info.pronouns = v->asString();
    if (const auto *v = data.get("author"))
      rec.info.authors = splitAuthors(v->asString());
    if (const auto *v = data.get("embed_color"))
      rec.info.embedColor = (uint32_t)(v->asInt(0) & 0xFFFFFF);
    if (const auto *v = data.get("atomic_number"); v && v->isInt())
      rec.info.atomicNumber = (int)v->asInt();

    if (const auto *table = data.get("table")) {
      SlicedSource src{};
      src.table = table->asString();
      if (!hasTable(doc.tables, src.table))
        return std::unexpected("element '" + name + "' references unknown table '" +
                               src.table + "'");
      if (const auto *c = data.get("coordinates"); c && c->isTable()) {
        const auto *x = c->get("x");
        const auto *y = c->get("y");
        if (!x || !y)
          Log::Warn("Element '{}' has incomplete coordinates", name);
        src.coordinates = {x ? (float)x->asInt(0) : 0.0f,
                           y ? (float)y->asInt(0) : 0.0f};
      } else {
        Log::Warn("Element '{}' has no coordinates, placing at (0, 0)", name);
      }
      rec.source = std::move(src);
    } else {
      EmbeddedSource src{};
      if (const auto *p = data.get("path"))
        src.path = p->asString();
      else
        Log::Warn("Element '{}' has neither a table nor a path", name);
      rec.source = std::move(src);
    }

    doc.elements.push_back(std::move(rec));
  }

  return doc;
}

std::expected<ElementsDocument, std::string>
ElementsFile::load(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    return std::unexpected("cannot open '" + path + "'");
  std::stringstream ss;
  ss << f.rdbuf();

  auto doc = parse(ss.str());
  if (!doc)
    return std::unexpected(path + ": " + doc.error());
  return doc;
}

static void writeInfo(std::ostringstream &o, const ElementInfo &info) {
  o << "symbol = " << Toml::formatString(info.symbol) << "\n";
  o << "pronouns = " << Toml::formatString(info.pronouns) << "\n";
  o << "author = " << Toml::formatString(joinAuthors(info.authors)) << "\n";
  o << "embed_color = " << hexColor(info.embedColor) << "\n";
}

std::string ElementsFile::write(const ElementsDocument &doc) {
  std::ostringstream o;
  o << "[tables]\n";
  for (const auto &t : doc.tables)
    o << Toml::formatKey(t.name) << " = " << Toml::formatString(t.imagePath)
      << "\n";

  for (const auto &t : doc.tables) {
    o << "\n### " << t.name << " ###\n\n\n";
    for (const auto &rec : doc.elements) {
      const auto *src = std::get_if<SlicedSource>(&rec.source);
      if (!src || src->table != t.name)
        continue;
      o << "[" << Toml::formatString(rec.info.name) << "]\n";
      o << "table = " << Toml::formatString(t.name) << "\n";
      writeInfo(o, rec.info);
      o << "coordinates = { x = " << coord(src->coordinates.x)
        << ", y = " << coord(src->coordinates.y) << " }\n";
      if (rec.info.atomicNumber)
        o << "atomic_number = " << *rec.info.atomicNumber << "\n";
      o << "\n";
    }
  }

  o << "\n### extras ###\n\n\n";
  for (const auto &rec : doc.elements) {
    const auto *src = std::get_if<EmbeddedSource>(&rec.source);
    if (!src)
      continue;
    o << "[" << Toml::formatString(rec.info.name) << "]\n";
    writeInfo(o, rec.info);
    if (rec.info.atomicNumber)
      o << "atomic_number = " << *rec.info.atomicNumber << "\n";
    o << "path = " << Toml::formatString(src->path) << "\n";
    o << "\n";
  }
  return o.str();
}

std::expected<void, std::string>
ElementsFile::save(const std::string &path, const ElementsDocument &doc) {
  try {
    const std::string text = write(doc);

    const std::filesystem::path p = std::filesystem::absolute(path);
    if (p.has_parent_path())
      std::filesystem::create_directories(p.parent_path());

    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f)
      return std::unexpected("cannot write '" + path + "'");
    f << text;
    if (!f)
      return std::unexpected("write failed for '" + path + "'");
  } catch (const std::exception &e) {
    return std::unexpected(std::string(e.what()));
  }

  Log::Info("Saved {} elements to '{}'", doc.elements.size(), path);
  return {};
}

void buildWorkspace(const ElementsDocument &doc, Workspace &out) {
  out.clear();
  for (const auto &t : doc.tables)
    out.addTable(t.name, t.imagePath);

  for (const auto &rec : doc.elements) {
    if (const auto *src = std::get_if<SlicedSource>(&rec.source)) {
      Table *table = out.findTable(src->table);
      if (!table)
        continue; // parse() rejects unknown tables
      table->elements.create(Element{rec.info, src->coordinates});
    } else {
      out.extras().push_back(rec);
    }
  }
}

ElementsDocument captureWorkspace(const Workspace &ws) {
  ElementsDocument doc{};
  for (const auto &t : ws.tables()) {
    doc.tables.push_back({t->name, t->imagePath});
    for (const Element &el : t->elements.elements())
      doc.elements.push_back(
          {el.info, SlicedSource{t->name, el.position.floor()}});
  }
  for (const auto &rec : ws.extras())
    doc.elements.push_back(rec);
  return doc;
}

} // namespace Tessera
