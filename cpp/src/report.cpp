#include "report.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

#include "log.hpp"

namespace {

std::ofstream open_csv(const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    return out;
}

void write_tape_row(std::ostream& out, const TapeEntry& e) {
    out << e.session_id << ',' << e.seq << ',' << e.ts << ',' << e.px << ',' << e.qty << ','
        << e.buyer << ',' << e.seller << ',' << e.buy_order_id << ',' << e.sell_order_id;
}

}  // namespace

void write_trades_header(std::ostream& out) {
    out << "session_id,seq,tick,price,qty,buyer,seller,buy_order_id,sell_order_id\n";
}

void write_trades(std::ostream& out, const std::vector<TapeEntry>& trades) {
    for (const auto& e : trades) {
        write_tape_row(out, e);
        out << '\n';
    }
}

void write_quotes_header(std::ostream& out) {
    out << "session_id,seq,tick,price,qty,buyer,seller,buy_order_id,sell_order_id,side\n";
}

void write_quotes(std::ostream& out, const std::vector<TapeEntry>& quotes) {
    for (const auto& e : quotes) {
        write_tape_row(out, e);
        out << ',' << side_name(e.side) << '\n';
    }
}

void write_balances_header(std::ostream& out) {
    out << "session_id,trader_type,n_traders,balance_sum,balance_avg\n";
}

void write_balances(std::ostream& out, const std::vector<BalanceRecord>& balances) {
    for (const auto& b : balances) {
        out << b.session_id << ',' << b.trader_type << ',' << b.n_traders << ',' << b.balance_sum << ','
            << std::fixed << std::setprecision(6) << b.balance_avg() << '\n';
    }
}

void write_reports(
    const std::vector<SessionResult>& results,
    const std::string& tape_path,
    const std::string& balances_path,
    const std::string& quotes_path
) {
    if (!tape_path.empty()) {
        auto out = open_csv(tape_path);
        write_trades_header(out);
        for (const auto& r : results) {
            write_trades(out, r.trades);
        }
        LogLine(LogLevel::Info, "Report") << "wrote trade tape to " << tape_path;
    }
    if (!balances_path.empty()) {
        auto out = open_csv(balances_path);
        write_balances_header(out);
        for (const auto& r : results) {
            write_balances(out, r.balances);
        }
        LogLine(LogLevel::Info, "Report") << "wrote balances to " << balances_path;
    }
    if (!quotes_path.empty()) {
        auto out = open_csv(quotes_path);
        write_quotes_header(out);
        for (const auto& r : results) {
            write_quotes(out, r.quotes);
        }
        LogLine(LogLevel::Info, "Report") << "wrote quote tape to " << quotes_path;
    }
}
