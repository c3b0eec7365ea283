#include <exception>
#include <iostream>

#include "pyro/app/app.hpp"
#include "pyro/app/options.hpp"

int main(int argc, char **argv)
{
  pyro::app::Options options;
  try
  {
    options = pyro::app::parse_args(argc, argv);
  }
  catch (const std::exception &e)
  {
    std::cerr << "[Options] " << e.what() << "\n";
    pyro::app::print_usage(std::cerr);
    return 1;
  }

  if (options.help)
  {
    pyro::app::print_usage(std::cout);
    return 0;
  }

  try
  {
    pyro::app::App app(options);
    return app.run();
  }
  catch (const std::exception &e)
  {
    std::cerr << "[pyro] fatal: " << e.what() << "\n";
    return 1;
  }
}
