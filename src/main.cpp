#include "predix/config.hpp"
#include "predix/database.hpp"
#include "predix/logger.hpp"
#include "predix/market_engine.hpp"
#include "predix/operator_console.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <chrono>
#include <memory>
#include <string>
#include <unistd.h>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int signal) {
        if (signal == SIGINT || signal == SIGTERM) {
            g_running = false;
            // Unblocks the console's read
            ::close(STDIN_FILENO);
        }
    }

    void print_usage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " [config.json]\n"
                  << "Environment: PREDIX_LMSR_B, PREDIX_LMSR_BUFFER, PREDIX_INITIAL_BALANCE,\n"
                  << "             PREDIX_FEE_RATE, PREDIX_RESULT_TTL_MS, PREDIX_LOG_LEVEL,\n"
                  << "             PREDIX_LOG_FILE, DATABASE_URL" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        print_usage(argv[0]);
        return argc > 2 ? 1 : 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto& log = predix::Logger::instance();

    predix::Config config;
    try {
        if (argc == 2) {
            config = predix::Config::from_file(argv[1]);
        }
        config.apply_env();
    } catch (const std::exception& e) {
        log.fatal("MAIN", "Failed to load configuration: ", e.what());
        return 1;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            log.fatal("MAIN", "Invalid configuration: ", problem);
        }
        return 1;
    }

    log.set_level(config.log_level);
    if (!config.log_file.empty()) {
        log.set_file(config.log_file);
    }

    log.info("MAIN", "=== PREDIX MARKET ENGINE ===");
    log.info("MAIN", "LMSR b=", config.lmsr_b, " buffer=", config.lmsr_buffer,
             " fee=", config.profit_fee_rate * 100.0, "%");

    // Declared first so it outlives the engine's background writer
    std::unique_ptr<predix::Database> db;
    predix::MarketEngine engine(config);

    if (!config.database_url.empty()) {
        db = std::make_unique<predix::Database>(config.database_url);
        if (db->connect() && db->ensure_schema()) {
            size_t rows = engine.load_from(*db);
            log.info("MAIN", "Restored ", rows, " rows from PostgreSQL");
            engine.enable_persistence(*db);
        } else {
            log.warn("MAIN", "PostgreSQL unavailable, running in-memory only");
            db.reset();
        }
    } else {
        log.info("MAIN", "No DATABASE_URL set, running in-memory only");
    }

    engine.start();

    predix::OperatorConsole console(engine);
    std::cout << "Type 'help' for commands" << std::endl;
    console.run(std::cin, std::cout, g_running);

    log.info("MAIN", "Shutting down");
    engine.wait_idle(std::chrono::seconds(5));
    engine.stop();
    return 0;
}
