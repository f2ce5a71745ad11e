#include "ElementInspector.h"

#include "core/Log.h"
#include "editor/SymbolText.h"
#include "model/Table.h"

#include <glm/glm.hpp>
#include <imgui.h>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace Tessera {

static constexpr size_t TextCapacity = 256;

// ImGui edits fixed buffers; copy in and out of the std::string.
static bool inputString(const char *label, std::string &value) {
  char buf[TextCapacity];
  std::snprintf(buf, sizeof(buf), "%s", value.c_str());
  if (!ImGui::InputText(label, buf, sizeof(buf)))
    return false;
  value = buf;
  return true;
}

static bool editColor(const char *label, uint32_t &color) {
  glm::vec3 c((float)((color >> 16) & 0xFF), (float)((color >> 8) & 0xFF),
              (float)(color & 0xFF));
  c /= 255.0f;
  if (!ImGui::ColorEdit3(label, &c.x))
    return false;
  const glm::uvec3 b = glm::uvec3(glm::clamp(c, 0.0f, 1.0f) * 255.0f);
  color = (b.r << 16) | (b.g << 8) | b.b;
  return true;
}

static bool editAuthors(std::vector<std::string> &authors) {
  bool changed = false;

  ImGui::TextUnformatted("Authors");
  ImGui::Indent();

  std::vector<std::string> kept;
  kept.reserve(authors.size() + 1);
  for (size_t i = 0; i < authors.size(); ++i) {
    ImGui::PushID((int)i);
    std::string author = authors[i];
    changed |= inputString("##author", author);
    ImGui::SameLine();
    if (ImGui::Button("-"))
      changed = true;
    else
      kept.push_back(std::move(author));
    ImGui::PopID();
  }

  if (ImGui::Button("+")) {
    kept.emplace_back();
    changed = true;
  }
  ImGui::Unindent();

  if (changed)
    authors = std::move(kept);
  return changed;
}

bool ElementInspector::draw(Table &table, ElementID &active) {
  Element *el = table.elements.find(active);
  if (!el)
    return false;

  bool changed = false;

  ImGui::SetNextWindowSize(ImVec2(360.0f, 0.0f), ImGuiCond_FirstUseEver);
  ImGui::Begin("Element");

  // Handles are unique per element, so widget ids survive reselection.
  ImGui::PushID((int)active.index);
  ImGui::PushID((int)active.generation);

  ElementInfo &info = el->info;
  changed |= inputString("Name", info.name);

  std::string symbol = symbolToEditable(info.symbol);
  if (inputString("Symbol", symbol)) {
    info.symbol = symbolFromEditable(symbol);
    changed = true;
  }

  changed |= inputString("Pronouns", info.pronouns);
  changed |= editColor("Embed Color", info.embedColor);

  bool hasNumber = info.atomicNumber.has_value();
  if (ImGui::Checkbox("Atomic Number", &hasNumber)) {
    if (hasNumber)
      info.atomicNumber = 0;
    else
      info.atomicNumber.reset();
    changed = true;
  }
  if (info.atomicNumber) {
    ImGui::SameLine();
    int n = *info.atomicNumber;
    if (ImGui::InputInt("##AtomicNumber", &n)) {
      info.atomicNumber = n;
      changed = true;
    }
  }

  ImGui::Text("Position: %.0f, %.0f", el->position.x, el->position.y);

  changed |= editAuthors(info.authors);

  ImGui::Separator();
  ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.6f, 0.0f, 0.0f, 1.0f));
  ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(0.8f, 0.4f, 0.4f, 1.0f));
  ImGui::PushStyleColor(ImGuiCol_ButtonActive, ImVec4(0.4f, 0.0f, 0.0f, 1.0f));
  const bool remove = ImGui::Button("Remove");
  ImGui::PopStyleColor(3);

  ImGui::PopID();
  ImGui::PopID();
  ImGui::End();

  if (remove) {
    Log::Info("Removed element '{}' from '{}'", info.name, table.name);
    table.elements.destroy(active);
    active = InvalidElement;
    changed = true;
  }

  return changed;
}

} // namespace Tessera
