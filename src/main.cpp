#include <stubgate/gate_cli.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// The hook must never block the edit it follows, so every failure still exits
// with status 0.
int main(int argc, char **argv) {
  try {
    const std::vector<std::string> arguments(argv + 1, argv + argc);
    return stubgate::RunGate(arguments, argc > 0 ? argv[0] : nullptr,
                             std::cin, std::cout, std::clog);
  } catch (const std::exception &ex) {
    std::cerr << "stubgate: error: " << ex.what() << "\n";
    return 0;
  }
}
