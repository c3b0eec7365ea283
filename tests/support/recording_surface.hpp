#pragma once

#include <cstdint>
#include <vector>

#include "pyro/view/render_surface.hpp"

namespace pyro::test {

class RecordingSurface : public view::RenderSurface {
 public:
  struct Rect {
    std::int64_t x;
    std::int64_t y;
    std::uint32_t width;
    std::uint32_t height;
    model::Rgb color;
  };

  // Either a clear or a rect, in call order.
  struct Call {
    bool isClear;
    Rect rect;
  };

  explicit RecordingSurface(core::SurfaceSize size = {80, 48}) : m_size(size) {}

  void clear(const model::Rgb &color) override {
    calls.push_back(Call{true, Rect{0, 0, m_size.width, m_size.height, color}});
  }

  void filledRect(std::int64_t x, std::int64_t y, std::uint32_t width, std::uint32_t height,
                  const model::Rgb &color) override {
    calls.push_back(Call{false, Rect{x, y, width, height, color}});
  }

  [[nodiscard]] core::SurfaceSize size() const override { return m_size; }

  [[nodiscard]] std::vector<Rect> rects() const {
    std::vector<Rect> out;
    for (const auto &c : calls)
      if (!c.isClear) out.push_back(c.rect);
    return out;
  }

  std::vector<Call> calls;

 private:
  core::SurfaceSize m_size;
};

}  // namespace pyro::test
