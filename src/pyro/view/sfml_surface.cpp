#include "pyro/view/sfml_surface.hpp"

#include <SFML/Graphics/RenderWindow.hpp>

#include <algorithm>

namespace pyro::view
{

  namespace
  {
    sf::Color toSf(const model::Rgb &c)
    {
      return sf::Color(c.r, c.g, c.b);
    }
  } // namespace

  SfmlSurface::SfmlSurface(sf::RenderWindow &window, core::SurfaceSize grid, unsigned pixelSize)
      : m_window(window), m_grid(grid), m_pixel_size(std::max(1u, pixelSize))
  {
  }

  void SfmlSurface::clear(const model::Rgb &color)
  {
    m_window.clear(toSf(color));
  }

  void SfmlSurface::filledRect(std::int64_t x, std::int64_t y, std::uint32_t width,
                               std::uint32_t height, const model::Rgb &color)
  {
    // clip to the grid so offscreen sparks never reach the GPU
    const std::int64_t x0 = std::max<std::int64_t>(x, 0);
    const std::int64_t y0 = std::max<std::int64_t>(y, 0);
    const std::int64_t x1 = std::min<std::int64_t>(x + width, m_grid.width);
    const std::int64_t y1 = std::min<std::int64_t>(y + height, m_grid.height);
    if (x0 >= x1 || y0 >= y1)
      return;

    const auto px = static_cast<float>(m_pixel_size);
    m_rect.setPosition(static_cast<float>(x0) * px, static_cast<float>(y0) * px);
    m_rect.setSize({static_cast<float>(x1 - x0) * px, static_cast<float>(y1 - y0) * px});
    m_rect.setFillColor(toSf(color));
    m_window.draw(m_rect);
  }

  void SfmlSurface::present()
  {
    m_window.display();
  }

} // namespace pyro::view
