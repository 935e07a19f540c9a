#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "engine.hpp"
#include "session.hpp"
#include "stats.hpp"

// CSV column order is fixed; see write_*_header.
void write_trades_header(std::ostream& out);
void write_trades(std::ostream& out, const std::vector<TapeEntry>& trades);

void write_quotes_header(std::ostream& out);
void write_quotes(std::ostream& out, const std::vector<TapeEntry>& quotes);

void write_balances_header(std::ostream& out);
void write_balances(std::ostream& out, const std::vector<BalanceRecord>& balances);

// One file per report across all days. An empty path skips that report.
// Throws std::runtime_error if a file cannot be opened.
void write_reports(
    const std::vector<SessionResult>& results,
    const std::string& tape_path,
    const std::string& balances_path,
    const std::string& quotes_path = ""
);
