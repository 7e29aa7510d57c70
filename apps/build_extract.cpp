#include <iostream>

#include <tilext/cli.hpp>

int main(int argc, char *argv[]) {
  std::string error;
  auto commandLine = tilext::parseCommandLine(argc, argv, &error);

  if (!commandLine) {
    std::cerr << "Error: " << error << "\n\n" << tilext::usage(argv[0]);
    return 1;
  }

  if (commandLine->help) {
    std::cout << tilext::usage(argv[0]);
    return 0;
  }

  return tilext::run(*commandLine);
}
