#include "Application.h"

#include "AppContext.h"

#include "assets/IconExporter.h"
#include "assets/ImageIO.h"
#include "core/Assert.h"
#include "core/Log.h"
#include "input/InputSystem.h"
#include "io/ElementsFile.h"
#include "platform/GLFWWindow.h"

#include <imgui.h>

#include <algorithm>
#include <filesystem>

namespace Tessera {

static constexpr const char *TitleBase = "elements.toml editor";

Application::Application(std::unique_ptr<AppContext> app,
                         EditorSettings settings, std::string settingsPath)
    : m_app(std::move(app)), m_settings(std::move(settings)),
      m_settingsPath(std::move(settingsPath)),
      m_controller(m_settings.camera) {
  TESSERA_ASSERT(m_app != nullptr, "Application requires AppContext");
}

Application::~Application() = default;

void Application::setupKeybinds() {
  m_keybinds.clear();

  Keybind save{};
  save.id = "save_document";
  save.chord.key = Key::S;
  save.chord.mods = KeyMod::Ctrl;
  save.priority = 10;
  save.enabled = [this]() { return m_documentLoaded; };
  save.action = [this]() { saveDocument(); };
  m_keybinds.add(std::move(save));
}

void Application::loadDocument() {
  const std::string &path = m_settings.files.elements;
  auto doc = ElementsFile::load(path);
  if (!doc) {
    Log::Error("Failed to load '{}': {}", path, doc.error());
    return;
  }

  buildWorkspace(*doc, m_workspace);
  m_documentLoaded = true;

  size_t elementCount = 0;
  for (const auto &t : m_workspace.tables())
    elementCount += t->elements.size();
  Log::Info("Loaded {} tables, {} elements, {} extras from '{}'",
            m_workspace.tables().size(), elementCount,
            m_workspace.extras().size(), path);

  loadTableImages();
}

void Application::loadTableImages() {
  const std::filesystem::path dir = m_settings.files.images;
  for (const auto &t : m_workspace.tables()) {
    const std::string file = (dir / t->imagePath).string();
    auto image = ImageIO::load(file);
    if (!image) {
      Log::Warn("Table '{}': {}", t->name, image.error());
      continue;
    }

    t->canvasSize = image->size();
    TableImage &slot = m_images[t->name];
    slot.image = std::move(*image);
    slot.texture.upload(slot.image);
  }
}

void Application::restoreSession() {
  const EditorSessionState &s = m_settings.session;
  Camera &cam = m_controller.camera();

  if (Table *t = m_workspace.findTable(s.table)) {
    m_activeTable = t;
    cam.setPosition(s.camera);
    cam.resetZoom(s.zoom);
    return;
  }

  if (!m_workspace.tables().empty()) {
    Log::Info("Session table '{}' not found, opening '{}'", s.table,
              m_workspace.tables().front()->name);
    activateTable(*m_workspace.tables().front());
  }
}

void Application::activateTable(Table &table) {
  m_activeTable = &table;
  m_controller.switchTable(table);
}

Application::TableImage *Application::activeImage() {
  if (!m_activeTable)
    return nullptr;
  auto it = m_images.find(m_activeTable->name);
  if (it == m_images.end())
    return nullptr;
  return &it->second;
}

void Application::drawUi(float dt) {
  const Keybind *save = m_keybinds.find("save_document");
  const MenuActions menu = m_menuBar.draw(
      m_workspace, m_activeTable, m_dirty, save ? save->chord.label() : "");
  if (menu.save)
    saveDocument();
  if (menu.exportIcons)
    exportIcons();
  if (menu.switchTo)
    activateTable(*menu.switchTo);

  // Camera tick and input run between laying out the canvas and drawing it,
  // so the frame shows this frame's camera, hover and drag.
  m_canvas.beginSurface();
  processInteractiveUpdate(dt);
  TableImage *img = activeImage();
  m_canvas.draw(m_activeTable, img ? &img->texture : nullptr, m_controller);

  if (m_activeTable) {
    ElementID active = m_controller.activeElement();
    if (m_inspector.draw(*m_activeTable, active))
      m_dirty = true;
    if (active != m_controller.activeElement())
      m_controller.setActiveElement(active);
  }
}

void Application::processInteractiveUpdate(float dt) {
  const InputState &input = m_app->window().input().state();
  const bool wantText = ImGui::GetIO().WantTextInput;

  const InteractionEvents events = m_controller.update(
      dt, input, m_canvas.viewport(), wantText, m_activeTable);

  if (!wantText) {
    if (const Keybind *kb = m_keybinds.process(input))
      Log::Debug("Shortcut {} ({})", kb->id, kb->chord.label());
  }

  handleEvents(events);
}

void Application::handleEvents(const InteractionEvents &events) {
  if (events.elementMoved)
    m_dirty = true;

  if (events.insertAt && m_activeTable) {
    Element e{};
    e.position = events.insertAt->floor();
    const ElementID id = m_activeTable->elements.create(std::move(e));
    m_controller.setActiveElement(id);
    m_dirty = true;
    Log::Info("Inserted element at {}, {}", events.insertAt->floor().x,
              events.insertAt->floor().y);
  }

  if (events.colorPickAt) {
    const TableImage *img = activeImage();
    if (!img) {
      Log::Warn("Color pick: no image for the active table");
      return;
    }
    const int x = (int)events.colorPickAt->x;
    const int y = (int)events.colorPickAt->y;
    const Rgba8 px = img->image.pixel(x, y);
    const std::string hex = formatHexColor(px.r, px.g, px.b);
    ImGui::SetClipboardText(hex.c_str());
    Log::Info("Picked {} at {}, {}", hex, x, y);
  }
}

void Application::saveDocument() {
  if (!m_documentLoaded) {
    Log::Warn("Nothing to save, no elements file was loaded");
    return;
  }

  const ElementsDocument doc = captureWorkspace(m_workspace);
  if (auto ok = ElementsFile::save(m_settings.files.elements, doc); !ok) {
    Log::Error("Save failed: {}", ok.error());
    return;
  }
  m_dirty = false;
  Log::Info("Saved '{}'", m_settings.files.elements);
}

void Application::exportIcons() {
  TableImage *img = activeImage();
  if (!m_activeTable || !img) {
    Log::Warn("Export icons: no table image loaded");
    return;
  }

  const std::string dir =
      (std::filesystem::path(m_settings.files.icons) / m_activeTable->name)
          .string();
  auto res = IconExporter::exportTable(*m_activeTable, img->image, dir);
  if (!res) {
    Log::Error("Export icons failed: {}", res.error());
    return;
  }
  if (res->skipped > 0)
    Log::Warn("Export icons: skipped {} elements", res->skipped);
}

void Application::storeSession() {
  EditorSessionState &s = m_settings.session;
  const Camera &cam = m_controller.camera();
  if (m_activeTable)
    s.table = m_activeTable->name;
  s.camera = cam.easingTarget().value_or(cam.position());
  s.zoom = cam.targetZoom();

  if (auto ok = EditorSettingsIO::save(m_settingsPath, m_settings); !ok)
    Log::Warn("Failed to save settings: {}", ok.error());
}

void Application::updateTitle() {
  std::string title = TitleBase;
  if (m_activeTable)
    title += " - " + m_activeTable->name;
  if (m_dirty)
    title += " *";
  m_app->window().setTitle(title);
}

int Application::run() {
  setupKeybinds();
  loadDocument();
  restoreSession();

  auto &win = m_app->window();
  float lastT = static_cast<float>(win.getTimeSeconds());

  while (!win.shouldClose()) {
    m_app->beginFrame();

    const float nowT = static_cast<float>(win.getTimeSeconds());
    const float dt = std::max(0.0f, nowT - lastT);
    lastT = nowT;

    if (win.isMinimized()) {
      win.waitEventsTimeout(0.1);
      lastT = static_cast<float>(win.getTimeSeconds());
      continue;
    }

    m_app->imguiBegin();
    drawUi(dt);
    updateTitle();
    m_app->imguiEnd();

    m_app->endFrame();
    win.input().endFrame();
  }

  if (m_dirty)
    Log::Warn("Closing with unsaved changes");
  storeSession();
  return 0;
}

} // namespace Tessera
