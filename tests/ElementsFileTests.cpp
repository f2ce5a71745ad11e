#include "io/ElementsFile.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Tessera;

static const char *kSample = R"([tables]
normal = "table.png"
nonperiodics = "nonperiodics.png"

### normal ###


["Hydrogen"]
table = "normal"
symbol = "H"
pronouns = "they/them"
author = "alice, bob"
embed_color = 0x3366FF
coordinates = { x = 10, y = 20 }
atomic_number = 1

["Water"]
table = "normal"
symbol = "H₂O"
pronouns = ""
author = ""
embed_color = 0x00FF00
coordinates = { x = 60, y = 20 }


### extras ###


["Mystery"]
symbol = "?"
pronouns = "it/its"
author = "carol"
embed_color = 0xFF0000
path = "mystery.png"
)";

static std::filesystem::path scratchDir(const char *name) {
  auto dir = std::filesystem::temp_directory_path() / "tessera_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

TEST(ElementsFile, ParsesTablesElementsAndExtras) {
  auto doc = ElementsFile::parse(kSample);
  ASSERT_TRUE(doc.has_value()) << doc.error();

  ASSERT_EQ(doc->tables.size(), 2u);
  EXPECT_EQ(doc->tables[0].name, "normal");
  EXPECT_EQ(doc->tables[0].imagePath, "table.png");
  EXPECT_EQ(doc->tables[1].name, "nonperiodics");

  ASSERT_EQ(doc->elements.size(), 3u);
  const ElementRecord &h = doc->elements[0];
  EXPECT_EQ(h.info.name, "Hydrogen");
  EXPECT_EQ(h.info.symbol, "H");
  EXPECT_EQ(h.info.pronouns, "they/them");
  ASSERT_EQ(h.info.authors.size(), 2u);
  EXPECT_EQ(h.info.authors[1], "bob");
  EXPECT_EQ(h.info.embedColor, 0x3366FFu);
  EXPECT_EQ(h.info.atomicNumber, std::optional<int>(1));
  const auto *src = std::get_if<SlicedSource>(&h.source);
  ASSERT_NE(src, nullptr);
  EXPECT_EQ(src->table, "normal");
  EXPECT_EQ(src->coordinates, Vector2(10.0f, 20.0f));

  const ElementRecord &w = doc->elements[1];
  EXPECT_TRUE(w.info.authors.empty());
  EXPECT_FALSE(w.info.atomicNumber.has_value());

  const auto *extra = std::get_if<EmbeddedSource>(&doc->elements[2].source);
  ASSERT_NE(extra, nullptr);
  EXPECT_EQ(extra->path, "mystery.png");
}

TEST(ElementsFile, WriterReproducesCanonicalLayout) {
  auto doc = ElementsFile::parse(kSample);
  ASSERT_TRUE(doc.has_value()) << doc.error();

  const std::string expected = R"([tables]
normal = "table.png"
nonperiodics = "nonperiodics.png"

### normal ###


["Hydrogen"]
table = "normal"
symbol = "H"
pronouns = "they/them"
author = "alice, bob"
embed_color = 0x3366FF
coordinates = { x = 10, y = 20 }
atomic_number = 1

["Water"]
table = "normal"
symbol = "H₂O"
pronouns = ""
author = ""
embed_color = 0x00FF00
coordinates = { x = 60, y = 20 }


### nonperiodics ###



### extras ###


["Mystery"]
symbol = "?"
pronouns = "it/its"
author = "carol"
embed_color = 0xFF0000
path = "mystery.png"

)";
  EXPECT_EQ(ElementsFile::write(*doc), expected);
}

TEST(ElementsFile, ReportsStructuralErrors) {
  auto noTables = ElementsFile::parse("[\"A\"]\nsymbol = \"A\"\n");
  ASSERT_FALSE(noTables.has_value());
  EXPECT_NE(noTables.error().find("[tables]"), std::string::npos);

  auto unknown = ElementsFile::parse(
      "[tables]\nnormal = \"t.png\"\n[\"A\"]\ntable = \"missing\"\n");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_NE(unknown.error().find("missing"), std::string::npos);

  auto syntax = ElementsFile::parse("[tables]\nnormal = [1]\n");
  ASSERT_FALSE(syntax.has_value());
  EXPECT_EQ(syntax.error().rfind("line 2:", 0), 0u);
}

TEST(ElementsFile, MissingCoordinatesDefaultToOrigin) {
  auto doc = ElementsFile::parse(
      "[tables]\nnormal = \"t.png\"\n[\"A\"]\ntable = \"normal\"\n");
  ASSERT_TRUE(doc.has_value()) << doc.error();
  const auto &src = std::get<SlicedSource>(doc->elements[0].source);
  EXPECT_EQ(src.coordinates, Vector2(0.0f, 0.0f));
}

TEST(ElementsFile, WorkspaceCaptureFloorsPositions) {
  auto doc = ElementsFile::parse(kSample);
  ASSERT_TRUE(doc.has_value()) << doc.error();

  Workspace ws;
  buildWorkspace(*doc, ws);
  ASSERT_EQ(ws.tables().size(), 2u);
  Table *normal = ws.findTable("normal");
  ASSERT_NE(normal, nullptr);
  ASSERT_EQ(normal->elements.size(), 2u);
  EXPECT_EQ(ws.extras().size(), 1u);

  normal->elements.at(0).position = {12.9f, 7.2f};
  const ElementsDocument back = captureWorkspace(ws);
  const auto &src = std::get<SlicedSource>(back.elements[0].source);
  EXPECT_EQ(src.coordinates, Vector2(12.0f, 7.0f));
  EXPECT_EQ(back.elements.size(), 3u);
}

TEST(ElementsFile, SaveThenLoad) {
  const auto dir = scratchDir("elements_file");
  const std::string path = (dir / "nested" / "elements.toml").string();

  auto doc = ElementsFile::parse(kSample);
  ASSERT_TRUE(doc.has_value());
  ASSERT_TRUE(ElementsFile::save(path, *doc).has_value());

  auto loaded = ElementsFile::load(path);
  ASSERT_TRUE(loaded.has_value()) << loaded.error();
  EXPECT_EQ(ElementsFile::write(*loaded), ElementsFile::write(*doc));

  EXPECT_FALSE(ElementsFile::load((dir / "absent.toml").string()).has_value());
}

TEST(ElementsFile, AuthorListFormat) {
  EXPECT_TRUE(splitAuthors("").empty());
  EXPECT_EQ(splitAuthors("solo"), std::vector<std::string>{"solo"});
  EXPECT_EQ(splitAuthors("a, b, c"),
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(joinAuthors({"a", "b"}), "a, b");
  EXPECT_EQ(joinAuthors({}), "");
}
