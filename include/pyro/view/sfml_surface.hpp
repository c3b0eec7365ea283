#pragma once

#include <SFML/Graphics/RectangleShape.hpp>

#include "pyro/view/render_surface.hpp"

namespace sf
{
  class RenderWindow;
}

namespace pyro::view
{

  /**
   * Logical pixel grid drawn into an SFML window, every logical pixel being a
   * pixelSize x pixelSize square. The window is owned by the caller.
   */
  class SfmlSurface final : public RenderSurface
  {
  public:
    SfmlSurface(sf::RenderWindow &window, core::SurfaceSize grid, unsigned pixelSize);

    void clear(const model::Rgb &color) override;
    void filledRect(std::int64_t x, std::int64_t y, std::uint32_t width, std::uint32_t height,
                    const model::Rgb &color) override;
    [[nodiscard]] core::SurfaceSize size() const override { return m_grid; }

    void present();

  private:
    sf::RenderWindow &m_window;
    core::SurfaceSize m_grid;
    unsigned m_pixel_size;
    sf::RectangleShape m_rect;
  };

} // namespace pyro::view
