#include <iostream>
#include <cstdlib>

#include "ulidkit/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    ulidkit::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  } catch (...) {
    std::cerr << "Fatal error: Unknown exception" << std::endl;
    return 1;
  }
}
