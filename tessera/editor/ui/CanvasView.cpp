#include "CanvasView.h"

#include "editor/CanvasOverlay.h"
#include "editor/InteractionController.h"
#include "model/Table.h"
#include "render/TableTexture.h"

#include <imgui.h>

#include <algorithm>
#include <cstdint>

namespace Tessera {

static ImVec2 toIm(const Vector2 &v) { return ImVec2(v.x, v.y); }

static ImU32 toU32(const Rgba8 &c) { return IM_COL32(c.r, c.g, c.b, c.a); }

void CanvasView::beginSurface() {
  const ImGuiViewport *vp = ImGui::GetMainViewport();
  ImGui::SetNextWindowPos(vp->WorkPos);
  ImGui::SetNextWindowSize(vp->WorkSize);

  ImGuiWindowFlags flags = ImGuiWindowFlags_NoTitleBar |
                           ImGuiWindowFlags_NoCollapse |
                           ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove;
  flags |= ImGuiWindowFlags_NoBringToFrontOnFocus |
           ImGuiWindowFlags_NoNavFocus | ImGuiWindowFlags_NoScrollbar |
           ImGuiWindowFlags_NoScrollWithMouse | ImGuiWindowFlags_NoBackground;

  ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
  ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
  ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
  ImGui::Begin("##TesseraCanvas", nullptr, flags);
  ImGui::PopStyleVar(3);

  const ImVec2 origin = ImGui::GetCursorScreenPos();
  const ImVec2 avail = ImGui::GetContentRegionAvail();
  m_viewport.origin = {origin.x, origin.y};
  m_viewport.size = {std::max(avail.x, 1.0f), std::max(avail.y, 1.0f)};
  m_viewport.hovered = ImGui::IsWindowHovered();
}

void CanvasView::draw(const Table *table, const TableTexture *texture,
                      const InteractionController &controller) {
  if (!table) {
    ImGui::TextDisabled("No table loaded");
    ImGui::End();
    return;
  }

  const CanvasOverlay overlay =
      buildCanvasOverlay(*table, controller, m_viewport);
  ImDrawList *dl = ImGui::GetWindowDrawList();

  if (texture && texture->valid()) {
    dl->AddImage((ImTextureID)(intptr_t)texture->glTexture(),
                 toIm(overlay.imageMin), toIm(overlay.imageMax));
  }

  for (const CanvasQuad &q : overlay.quads) {
    if (q.filled)
      dl->AddRectFilled(toIm(q.min), toIm(q.max), toU32(q.color));
    else
      dl->AddRect(toIm(q.min), toIm(q.max), toU32(q.color), 0.0f, 0,
                  q.thickness);
  }

  ImGui::End();
}

} // namespace Tessera
