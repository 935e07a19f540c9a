#include <cstdint>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
namespace py = pybind11;

#include "book.hpp"
#include "engine.hpp"
#include "matching.hpp"
#include "mlofi.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "traders.hpp"

PYBIND11_MODULE(lobsim_cpp, m){
    py::enum_<Side>(m, "Side")
        .value("BID", Side::Bid)
        .value("ASK", Side::Ask)
        .export_values();

    py::enum_<SubmitStatus>(m, "SubmitStatus")
        .value("ACCEPTED", SubmitStatus::Accepted)
        .value("REJECTED", SubmitStatus::Rejected)
        .value("SESSION_CLOSED", SubmitStatus::SessionClosed);

    py::enum_<TraderKind>(m, "TraderKind")
        .value("GVWY", TraderKind::Giveaway)
        .value("ZIC", TraderKind::ZIC)
        .value("SHVR", TraderKind::Shaver)
        .value("SNPR", TraderKind::Sniper)
        .value("ZIP", TraderKind::ZIP)
        .value("IMPS", TraderKind::ImpactSensitive)
        .value("IMPF", TraderKind::ImpactSensitiveFiltered);

    py::enum_<SessionState>(m, "SessionState")
        .value("OPEN", SessionState::Open)
        .value("TRADING", SessionState::Trading)
        .value("CLOSED", SessionState::Closed);

    py::class_<Order>(m, "Order")
        .def(
            py::init<int64_t, Side, int64_t, int64_t, int64_t, std::string>(),
            py::arg("id"),
            py::arg("side"),
            py::arg("px"),
            py::arg("qty"),
            py::arg("ts"),
            py::arg("owner") = "SIM"
        )
        .def_readwrite("id", &Order::id)
        .def_readwrite("side", &Order::side)
        .def_readwrite("px", &Order::px)
        .def_readwrite("qty", &Order::qty)
        .def_readwrite("ts", &Order::ts)
        .def_readwrite("owner", &Order::owner);

    py::class_<BookLevel>(m, "BookLevel")
        .def_readwrite("px", &BookLevel::px)
        .def_readwrite("qty", &BookLevel::qty);

    py::class_<LevelSnapshot>(m, "LevelSnapshot")
        .def(py::init<>())
        .def_readwrite("revision", &LevelSnapshot::revision)
        .def_readwrite("ts", &LevelSnapshot::ts)
        .def_readwrite("bids", &LevelSnapshot::bids)
        .def_readwrite("asks", &LevelSnapshot::asks);

    py::class_<Trade>(m, "Trade")
        .def_readonly("id", &Trade::id)
        .def_readonly("px", &Trade::px)
        .def_readonly("qty", &Trade::qty)
        .def_readonly("buy_order_id", &Trade::buy_order_id)
        .def_readonly("sell_order_id", &Trade::sell_order_id)
        .def_readonly("buyer", &Trade::buyer)
        .def_readonly("seller", &Trade::seller)
        .def_readonly("aggressor", &Trade::aggressor)
        .def_readonly("ts", &Trade::ts);

    py::class_<LimitOrderBook>(m, "LimitOrderBook")
        .def(py::init<>())
        .def("best_bid", &LimitOrderBook::best_bid)
        .def("best_ask", &LimitOrderBook::best_ask)
        .def("mid", &LimitOrderBook::mid)
        .def("spread", &LimitOrderBook::spread)
        .def("microprice", &LimitOrderBook::microprice)
        .def("depth", &LimitOrderBook::depth, py::arg("side"), py::arg("levels") = 5)
        .def("levels", &LimitOrderBook::levels, py::arg("depth"))
        .def("order_count", py::overload_cast<>(&LimitOrderBook::order_count, py::const_));

    py::class_<SubmitResult>(m, "SubmitResult")
        .def_readonly("status", &SubmitResult::status)
        .def_readonly("trades", &SubmitResult::trades)
        .def_readonly("resting_id", &SubmitResult::resting_id)
        .def_readonly("reason", &SubmitResult::reason)
        .def("accepted", &SubmitResult::accepted)
        .def("traded_qty", &SubmitResult::traded_qty);

    py::class_<MatchingEngine>(m, "MatchingEngine")
        .def(py::init<LimitOrderBook&>(), py::arg("book"), py::keep_alive<1, 2>())
        .def("submit", &MatchingEngine::submit, py::arg("order"))
        .def("cancel", &MatchingEngine::cancel, py::arg("order_id"))
        .def("n_trades", &MatchingEngine::n_trades);

    py::class_<SignalConfig>(m, "SignalConfig")
        .def(py::init<>())
        .def_readwrite("depth", &SignalConfig::depth)
        .def_readwrite("significance_threshold", &SignalConfig::significance_threshold)
        .def_readwrite("window", &SignalConfig::window)
        .def_readwrite("impact_gain", &SignalConfig::impact_gain)
        .def_readwrite("level_decay", &SignalConfig::level_decay)
        .def_readwrite("blend", &SignalConfig::blend)
        .def_readwrite("mlofi_threshold", &SignalConfig::mlofi_threshold)
        .def_readwrite("cross_countdown", &SignalConfig::cross_countdown)
        .def("validate", &SignalConfig::validate);

    py::class_<ImbalanceSignal>(m, "ImbalanceSignal")
        .def(py::init<const SignalConfig&>(), py::arg("config") = SignalConfig{})
        .def("observe", &ImbalanceSignal::observe, py::arg("snapshot"))
        .def("reset", &ImbalanceSignal::reset)
        .def("ready", &ImbalanceSignal::ready)
        .def("latest", &ImbalanceSignal::latest)
        .def("pressure", &ImbalanceSignal::pressure)
        .def("quote_offset", &ImbalanceSignal::quote_offset)
        .def("volume_ratio", &ImbalanceSignal::volume_ratio)
        .def("significant", &ImbalanceSignal::significant);

    m.def("imbalance_alter", &imbalance_alter, py::arg("prev"), py::arg("curr"), py::arg("m"));
    m.def("is_imbalance_significant", &is_imbalance_significant, py::arg("value"), py::arg("threshold"));

    py::class_<PopulationEntry>(m, "PopulationEntry")
        .def(py::init<TraderKind, int64_t>(), py::arg("kind"), py::arg("count"))
        .def_readwrite("kind", &PopulationEntry::kind)
        .def_readwrite("count", &PopulationEntry::count);

    py::class_<SessionConfig>(m, "SessionConfig")
        .def(py::init<>())
        .def_readwrite("session_id", &SessionConfig::session_id)
        .def_readwrite("n_ticks", &SessionConfig::n_ticks)
        .def_readwrite("seed", &SessionConfig::seed)
        .def_readwrite("min_price", &SessionConfig::min_price)
        .def_readwrite("max_price", &SessionConfig::max_price)
        .def_readwrite("signal", &SessionConfig::signal)
        .def_readwrite("buyers", &SessionConfig::buyers)
        .def_readwrite("sellers", &SessionConfig::sellers)
        .def("validate", &SessionConfig::validate);

    py::class_<TapeEntry>(m, "TapeEntry")
        .def_readonly("session_id", &TapeEntry::session_id)
        .def_readonly("seq", &TapeEntry::seq)
        .def_readonly("ts", &TapeEntry::ts)
        .def_readonly("side", &TapeEntry::side)
        .def_readonly("px", &TapeEntry::px)
        .def_readonly("qty", &TapeEntry::qty)
        .def_readonly("buyer", &TapeEntry::buyer)
        .def_readonly("seller", &TapeEntry::seller);

    py::class_<SessionStats>(m, "SessionStats")
        .def(py::init<>())
        .def_readwrite("n_ticks", &SessionStats::n_ticks)
        .def_readwrite("n_quotes", &SessionStats::n_quotes)
        .def_readwrite("n_idle", &SessionStats::n_idle)
        .def_readwrite("n_rejected", &SessionStats::n_rejected)
        .def_readwrite("n_strategy_errors", &SessionStats::n_strategy_errors)
        .def_readwrite("n_trades", &SessionStats::n_trades)
        .def_readwrite("traded_qty", &SessionStats::traded_qty)
        .def("avg_spread", &SessionStats::avg_spread);

    py::class_<BalanceRecord>(m, "BalanceRecord")
        .def_readonly("session_id", &BalanceRecord::session_id)
        .def_readonly("trader_type", &BalanceRecord::trader_type)
        .def_readonly("n_traders", &BalanceRecord::n_traders)
        .def_readonly("balance_sum", &BalanceRecord::balance_sum)
        .def("balance_avg", &BalanceRecord::balance_avg);

    py::class_<MarketSession>(m, "MarketSession")
        .def(py::init<const SessionConfig&>(), py::arg("config"))
        .def("state", &MarketSession::state)
        .def("open", &MarketSession::open)
        .def("step", &MarketSession::step)
        .def("run", &MarketSession::run, py::call_guard<py::gil_scoped_release>())
        .def("close", &MarketSession::close)
        .def("request_stop", &MarketSession::request_stop)
        .def("snapshot", &MarketSession::snapshot)
        .def("tape", &MarketSession::tape)
        .def("trades", &MarketSession::trades)
        .def("balances", &MarketSession::balances)
        .def("stats", &MarketSession::stats)
        .def("tick", &MarketSession::tick);

    py::class_<SessionResult>(m, "SessionResult")
        .def_readonly("session_id", &SessionResult::session_id)
        .def_readonly("trades", &SessionResult::trades)
        .def_readonly("balances", &SessionResult::balances)
        .def_readonly("stats", &SessionResult::stats);

    py::class_<ExperimentConfig>(m, "ExperimentConfig")
        .def(py::init<>())
        .def_readwrite("session_prefix", &ExperimentConfig::session_prefix)
        .def_readwrite("n_days", &ExperimentConfig::n_days)
        .def_readwrite("n_workers", &ExperimentConfig::n_workers)
        .def_readwrite("session", &ExperimentConfig::session);

    m.def("run_session", &run_session, py::arg("config"), py::arg("keep_quotes") = false);
    m.def("run_experiment", &run_experiment, py::arg("config"), py::call_guard<py::gil_scoped_release>());
}
