#include "pyro/controller/input_state.hpp"

#include <SFML/Window/Event.hpp>

namespace pyro::controller {

void InputState::processEvent(const sf::Event& event) {
  switch (event.type) {
    case sf::Event::Closed:
      m_quit_requested = true;
      break;

    case sf::Event::KeyPressed:
      if (event.key.code == sf::Keyboard::Q || event.key.code == sf::Keyboard::Escape)
        m_quit_requested = true;
      break;

    default:
      break;
  }
}

}  // namespace pyro::controller
