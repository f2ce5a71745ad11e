#include "MainMenuBar.h"

#include "model/Workspace.h"

#include <imgui.h>

#include <string>

namespace Tessera {

// Tables with this in their name are not reachable from the menu.
static bool isHiddenTable(const std::string &name) {
  return name.find("gender") != std::string::npos;
}

MenuActions MainMenuBar::draw(const Workspace &workspace,
                              const Table *activeTable, bool dirty,
                              const std::string &saveShortcut) {
  MenuActions out{};
  if (!ImGui::BeginMainMenuBar())
    return out;

  if (ImGui::Button(dirty ? "Save*" : "Save"))
    out.save = true;
  if (!saveShortcut.empty() && ImGui::IsItemHovered())
    ImGui::SetTooltip("%s", saveShortcut.c_str());

  ImGui::BeginDisabled(activeTable == nullptr);
  if (ImGui::Button("Export Icons"))
    out.exportIcons = true;
  ImGui::EndDisabled();

  ImGui::TextUnformatted("|");

  ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.0f, 0.0f, 0.0f, 0.0f));
  ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(1.0f, 1.0f, 1.0f, 0.3f));
  ImGui::PushStyleColor(ImGuiCol_ButtonActive, ImVec4(1.0f, 1.0f, 1.0f, 0.1f));
  ImGui::PushStyleVar(ImGuiStyleVar_ItemSpacing, ImVec2(0.0f, 0.0f));

  for (const auto &table : workspace.tables()) {
    if (isHiddenTable(table->name))
      continue;
    const bool current = table.get() == activeTable;
    if (current)
      ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 0.8f, 0.3f, 1.0f));
    if (ImGui::Button(table->name.c_str()))
      out.switchTo = table.get();
    if (current)
      ImGui::PopStyleColor();
  }

  ImGui::PopStyleVar(1);
  ImGui::PopStyleColor(3);

  ImGui::EndMainMenuBar();
  return out;
}

} // namespace Tessera
