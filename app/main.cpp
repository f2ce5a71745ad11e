#include "core/Log.h"

#include "app/AppContext.h"
#include "app/Application.h"
#include "config/EditorSettings.h"
#include "platform/GLFWWindow.h"

#include <memory>
#include <string>

int main(int argc, char** argv) {
  Tessera::Log::Init();

  const std::string settingsPath =
      (argc > 1 && argv[1]) ? argv[1] : "tessera_editor.cfg";

  Tessera::EditorSettings settings{};
  if (auto ok = Tessera::EditorSettingsIO::load(settingsPath, settings); !ok)
    Tessera::Log::Error("Settings: {}", ok.error());

  Tessera::WindowDesc desc{};
  desc.width = settings.window.width;
  desc.height = settings.window.height;
  desc.title = "elements.toml editor";
  desc.vsync = settings.window.vsync;

  auto window = std::make_unique<Tessera::GLFWWindow>(desc);
  auto app = std::make_unique<Tessera::AppContext>(std::move(window));

  Tessera::Application application(std::move(app), std::move(settings),
                                   settingsPath);
  return application.run();
}
