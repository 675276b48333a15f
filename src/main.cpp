#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>
#include <system_error>

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments (and --conf= file)
    bridgerelay::app::AppConfig config;
    bridgerelay::app::CommandLine cmdline;
    std::vector<std::string> errors;
    std::vector<std::string> args(argv + 1, argv + argc);

    bool parsed =
        bridgerelay::app::ParseCommandLine(args, config, cmdline, errors);

    if (cmdline.show_help) {
      std::cout << bridgerelay::app::GetUsage(argv[0]) << std::endl;
      return 0;
    }
    if (cmdline.show_version) {
      std::cout << bridgerelay::GetFullVersionString() << std::endl;
      std::cout << bridgerelay::GetCopyrightString() << std::endl;
      return 0;
    }

    if (!parsed) {
      for (const auto &e : errors) {
        std::cerr << "Error: " << e << std::endl;
      }
      std::cerr << bridgerelay::app::GetUsage(argv[0]) << std::endl;
      return 1;
    }

    auto validation_errors = bridgerelay::app::ValidateConfig(config);
    if (!validation_errors.empty()) {
      for (const auto &e : validation_errors) {
        std::cerr << "Error: " << e << std::endl;
      }
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: cannot create data directory "
                << config.datadir.string() << ": " << ec.message()
                << std::endl;
      return 1;
    }

    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    bridgerelay::util::LogManager::Initialize(config.log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : config.debug_components) {
      if (component == "all") {
        bridgerelay::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        bridgerelay::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        bridgerelay::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    auto logger = bridgerelay::util::LogManager::GetLogger("app");

    // IMPORTANT: Use nested scope to ensure app destructor runs before
    // LogManager::Shutdown() so no async callback logs into a dropped logger
    {
      bridgerelay::app::Application app(config);

      if (!app.initialize()) {
        logger->error("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        logger->error("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    bridgerelay::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    bridgerelay::util::LogManager::Shutdown();
    return 1;
  }
}
