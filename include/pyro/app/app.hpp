#pragma once

#include "pyro/app/options.hpp"

namespace pyro::app
{

  class App
  {
  public:
    explicit App(Options options = {});
    int run();

  private:
    Options m_options;
  };

} // namespace pyro::app
