#include <exception>
#include <iostream>

#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "report.hpp"

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: lobsim <config.json>\n";
        return 1;
    }

    try {
        const AppConfig cfg = load_config(argv[1]);
        set_log_level(cfg.log_level);

        const auto results = run_experiment(cfg.experiment);
        write_reports(results, cfg.tape_path, cfg.balances_path, cfg.quotes_path);

        for (const auto& r : results) {
            std::cout << r.session_id << ": " << r.stats.n_trades << " trades, "
                      << r.stats.traded_qty << " qty, avg spread " << r.stats.avg_spread() << "\n";
            for (const auto& b : r.balances) {
                std::cout << "  " << b.trader_type << " x" << b.n_traders << " avg " << b.balance_avg() << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[lobsim] fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
