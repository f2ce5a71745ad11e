#pragma once

#include "config/EditorSettings.h"
#include "editor/InteractionController.h"
#include "editor/ui/CanvasView.h"
#include "editor/ui/ElementInspector.h"
#include "editor/ui/MainMenuBar.h"
#include "image/Image.h"
#include "input/Keybinds.h"
#include "model/Workspace.h"
#include "render/TableTexture.h"

#include <memory>
#include <string>
#include <unordered_map>

namespace Tessera {

class AppContext;

class Application final {
public:
  Application(std::unique_ptr<AppContext> app, EditorSettings settings,
              std::string settingsPath);
  ~Application();

  int run();

private:
  struct TableImage final {
    Image image;
    TableTexture texture;
  };

  void setupKeybinds();
  void loadDocument();
  void loadTableImages();
  void restoreSession();

  void activateTable(Table &table);
  TableImage *activeImage();

  void drawUi(float dt);
  void processInteractiveUpdate(float dt);
  void handleEvents(const InteractionEvents &events);

  void saveDocument();
  void exportIcons();
  void storeSession();
  void updateTitle();

private:
  std::unique_ptr<AppContext> m_app;
  EditorSettings m_settings;
  std::string m_settingsPath;

  Workspace m_workspace{};
  Table *m_activeTable = nullptr;
  std::unordered_map<std::string, TableImage> m_images;

  InteractionController m_controller;
  KeybindManager m_keybinds{};

  MainMenuBar m_menuBar{};
  CanvasView m_canvas{};
  ElementInspector m_inspector{};

  bool m_documentLoaded = false;
  bool m_dirty = false;
};

} // namespace Tessera
