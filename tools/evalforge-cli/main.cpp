#include <evalforge/cli/evalforge_cli.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        // Command output goes to stdout; keep log lines on stderr.
        spdlog::set_default_logger(spdlog::stderr_color_mt("evalforge"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        evalforge::cli::EvalforgeCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
