#pragma once

namespace sf
{
  class Event;
}

namespace pyro::controller
{

  // Keyboard/window state sampled once per tick by the driver.
  class InputState
  {
  public:
    void processEvent(const sf::Event &event);

    [[nodiscard]] bool quitRequested() const { return m_quit_requested; }

  private:
    bool m_quit_requested = false; // Latched, never cleared.
  };

} // namespace pyro::controller
