#pragma once

#include "predix/market_engine.hpp"
#include <atomic>
#include <iosfwd>
#include <string>

namespace predix {

// Line-oriented admin front end; every reply is one JSON document.
class OperatorConsole {
public:
    explicit OperatorConsole(MarketEngine& engine);

    // Handles one command line and returns the JSON reply
    std::string process_command(const std::string& line);

    // Reads commands until EOF, "quit" or running becomes false
    void run(std::istream& in, std::ostream& out, const std::atomic<bool>& running);

private:
    MarketEngine& engine_;
};

} // namespace predix
