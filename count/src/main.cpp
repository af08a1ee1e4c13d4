#include "Config.h"
#include "CountJob.h"
#include "Errors.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // Report EPIPE as a write error instead of dying silently
    signal(SIGPIPE, SIG_IGN);

    // stdout may carry the token counts, keep diagnostics on stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("corpus-count"));

    try {
        auto config = corpuscount::ParseCommandLine(argc, argv);
        if (config.show_help) {
            std::cout << corpuscount::Usage(argv[0]);
            return 0;
        }

        corpuscount::ValidateConfig(config);
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        corpuscount::RunCountJob(config);
    } catch (const corpuscount::ConfigError& e) {
        spdlog::error("invalid configuration: {}", e.what());
        std::cerr << corpuscount::Usage(argv[0]);
        return 2;
    } catch (const corpuscount::IoError& e) {
        spdlog::error("I/O error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("fatal exception: {}", e.what());
        return 1;
    }

    return 0;
}
