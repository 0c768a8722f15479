#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

#include "application.hpp"
#include "errors.hpp"
#include "filesystem.hpp"
#include "groupreport.hpp"

namespace {

std::atomic<bool> g_cancelled{false};

void onInterrupt(int) { g_cancelled.store(true); }

} // namespace

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "neardup-cli";

  CliOptions options;
  try {
    options = Application::parseArguments(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n\n"
              << Application::usage(program);
    return Application::EXIT_ABORT;
  }

  if (options.help) {
    std::cout << Application::usage(program);
    return Application::EXIT_OK;
  }

  std::signal(SIGINT, onInterrupt);

  try {
    LocalFileSystem fileSystem;
    GroupReport view(std::cout);
    Application app(view, fileSystem);
    return app.run(options, &g_cancelled);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return Application::EXIT_ABORT;
  }
}
