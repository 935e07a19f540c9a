#include <catch2/catch.hpp>

#include "engine.hpp"
#include "errors.hpp"

namespace {

ExperimentConfig small_experiment(int64_t n_days, int64_t n_workers) {
    ExperimentConfig x;
    x.session_prefix = "day";
    x.n_days = n_days;
    x.n_workers = n_workers;
    x.session.n_ticks = 200;
    x.session.seed = 40;
    x.session.max_price = 200;
    x.session.buyers = {PopulationEntry{TraderKind::ZIC, 4}, PopulationEntry{TraderKind::ImpactSensitive, 2}};
    x.session.sellers = {PopulationEntry{TraderKind::ZIC, 4}, PopulationEntry{TraderKind::ZIP, 2}};
    x.session.schedule.interval = 40;
    return x;
}

}  // namespace

TEST_CASE("ExperimentConfig derives one config per day", "[engine]") {
    auto x = small_experiment(3, 1);
    REQUIRE(x.session_id(0) == "day0001");
    REQUIRE(x.session_id(11) == "day0012");

    auto d0 = x.day_config(0);
    auto d2 = x.day_config(2);
    REQUIRE(d0.session_id == "day0001");
    REQUIRE(d2.session_id == "day0003");
    REQUIRE(d0.seed == 40);
    REQUIRE(d2.seed == 42);
    REQUIRE(d2.n_ticks == x.session.n_ticks);

    x.n_days = 0;
    REQUIRE_THROWS_AS(x.validate(), ConfigError);
    x.n_days = 1;
    x.n_workers = 0;
    REQUIRE_THROWS_AS(x.validate(), ConfigError);
}

TEST_CASE("run_session keeps quotes only on request", "[engine]") {
    auto cfg = small_experiment(1, 1).day_config(0);
    auto without = run_session(cfg);
    auto with = run_session(cfg, true);

    REQUIRE(without.session_id == "day0001");
    REQUIRE(without.quotes.empty());
    REQUIRE_FALSE(with.quotes.empty());
    REQUIRE(with.trades.size() == without.trades.size());
    REQUIRE(static_cast<int64_t>(with.quotes.size()) == with.stats.n_quotes);
    for (const auto& q : with.quotes) {
        REQUIRE(q.kind == TapeKind::Quote);
    }
}

TEST_CASE("run_experiment results do not depend on the worker count", "[engine]") {
    const auto serial = run_experiment(small_experiment(4, 1));
    const auto parallel = run_experiment(small_experiment(4, 3));

    REQUIRE(serial.size() == 4);
    REQUIRE(parallel.size() == 4);
    for (size_t d = 0; d < serial.size(); ++d) {
        REQUIRE(serial[d].session_id == parallel[d].session_id);
        REQUIRE(serial[d].trades.size() == parallel[d].trades.size());
        REQUIRE(serial[d].stats.n_quotes == parallel[d].stats.n_quotes);
        for (size_t i = 0; i < serial[d].trades.size(); ++i) {
            REQUIRE(serial[d].trades[i].px == parallel[d].trades[i].px);
        }
        REQUIRE(serial[d].balances.size() == 3);
    }
    REQUIRE(serial[0].session_id == "day0001");
    REQUIRE(serial[3].session_id == "day0004");
}

TEST_CASE("run_experiment surfaces configuration errors", "[engine][errors]") {
    auto x = small_experiment(2, 2);
    x.session.sellers.clear();
    REQUIRE_THROWS_AS(run_experiment(x), ConfigError);
}
