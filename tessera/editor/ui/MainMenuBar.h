#pragma once

#include <string>

namespace Tessera {

class Workspace;
struct Table;

// What the user asked for through the menu bar this frame.
struct MenuActions final {
  bool save = false;
  bool exportIcons = false;
  Table *switchTo = nullptr;
};

class MainMenuBar final {
public:
  // saveShortcut is shown as the Save button's tooltip.
  MenuActions draw(const Workspace &workspace, const Table *activeTable,
                   bool dirty, const std::string &saveShortcut);
};

} // namespace Tessera
