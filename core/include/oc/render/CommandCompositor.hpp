#pragma once
#include "oc/render/Compositor.hpp"

#include <rapidjson/document.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace oc {

// Records each compositor call of a frame as a JSON command so a host
// renderer can replay it. clear() starts a new frame.
//
// Frame layout:
//   {"frame":n,"width":w,"height":h,"commands":[{"op":"clear"}, ...]}
// Ops: clear, batch, shapes, clip, clearClip, border.
// Non-finite coordinates are dropped rather than written.
class CommandCompositor : public Compositor {
public:
  CommandCompositor();

  void setupHighDPI(double width, double height) override;
  void clear() override;
  void render(const ShapeBatch& batch) override;
  void renderShapes(const ShapeList& shapes) override;
  void setClipRegion(const Bounds& bounds) override;
  void clearClipRegion() override;
  void drawBorder(const Bounds& bounds) override;

  std::string frameJson() const;

  std::uint64_t frameNumber() const { return frame_; }
  std::size_t commandCount() const { return commands_.Size(); }
  std::vector<std::string> ops() const;

private:
  rapidjson::Value& push(const char* op);

  rapidjson::Document commands_;
  std::uint64_t frame_{0};
  double width_{0};
  double height_{0};
};

} // namespace oc
