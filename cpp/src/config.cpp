#include "config.hpp"

#include <fstream>
#include <utility>

#include "errors.hpp"

using json = nlohmann::json;

namespace {

std::vector<PopulationEntry> parse_population(const json& arr, const char* which) {
    if (!arr.is_array()) {
        throw ConfigError(std::string(which) + " must be an array of {type, count}");
    }
    std::vector<PopulationEntry> out;
    for (const auto& e : arr) {
        out.push_back(PopulationEntry{
            parse_trader_kind(e.at("type").get<std::string>()),
            e.at("count").get<int64_t>(),
        });
    }
    return out;
}

std::vector<ScheduleZone> parse_zones(const json& arr, const char* which) {
    if (!arr.is_array()) {
        throw ConfigError(std::string(which) + " must be an array of zones");
    }
    std::vector<ScheduleZone> out;
    for (const auto& z : arr) {
        ScheduleZone zone;
        zone.from = z.value("from", zone.from);
        zone.to = z.value("to", zone.to);
        zone.step_mode = parse_step_mode(z.value("step_mode", std::string("fixed")));
        for (const auto& r : z.at("ranges")) {
            if (!r.is_array() || r.size() != 2) {
                throw ConfigError(std::string(which) + " price range must be [lo, hi]");
            }
            zone.ranges.push_back(PriceRange{r[0].get<int64_t>(), r[1].get<int64_t>()});
        }
        out.push_back(std::move(zone));
    }
    return out;
}

void parse_signal(const json& j, SignalConfig& s) {
    s.depth = j.value("depth", s.depth);
    s.significance_threshold = j.value("threshold", s.significance_threshold);
    s.window = j.value("window", s.window);
    s.impact_gain = j.value("impact_gain", s.impact_gain);
    s.level_decay = j.value("level_decay", s.level_decay);
    s.blend = j.value("blend", s.blend);
    s.mlofi_threshold = j.value("mlofi_threshold", s.mlofi_threshold);
    s.cross_countdown = j.value("cross_countdown", s.cross_countdown);
}

void parse_schedule(const json& j, OrderSchedule& s) {
    s.interval = j.value("interval", s.interval);
    if (j.contains("time_mode")) {
        s.time_mode = parse_time_mode(j.at("time_mode").get<std::string>());
    }
    s.shuffle_times = j.value("shuffle_times", s.shuffle_times);
    s.qty = j.value("qty", s.qty);
    if (j.contains("supply")) {
        s.supply = parse_zones(j.at("supply"), "supply");
    }
    if (j.contains("demand")) {
        s.demand = parse_zones(j.at("demand"), "demand");
    }
}

}  // namespace

AppConfig parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    AppConfig cfg;
    ExperimentConfig& x = cfg.experiment;
    SessionConfig& s = x.session;
    try {
        x.session_prefix = j.value("session_prefix", x.session_prefix);
        x.n_days = j.value("n_days", x.n_days);
        x.n_workers = j.value("n_workers", x.n_workers);

        s.n_ticks = j.value("n_ticks", s.n_ticks);
        s.seed = j.value("seed", s.seed);
        s.min_price = j.value("min_price", s.min_price);
        s.max_price = j.value("max_price", s.max_price);

        if (j.contains("log_level")) {
            cfg.log_level = parse_log_level(j.at("log_level").get<std::string>());
        }
        cfg.tape_path = j.value("tape_path", cfg.tape_path);
        cfg.balances_path = j.value("balances_path", cfg.balances_path);
        cfg.quotes_path = j.value("quotes_path", cfg.quotes_path);
        x.keep_quotes = !cfg.quotes_path.empty();

        if (j.contains("signal")) {
            parse_signal(j.at("signal"), s.signal);
        }
        if (j.contains("schedule")) {
            parse_schedule(j.at("schedule"), s.schedule);
        }
        s.buyers = parse_population(j.at("buyers"), "buyers");
        s.sellers = parse_population(j.at("sellers"), "sellers");
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad configuration: ") + e.what());
    }

    x.validate();
    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Failed to open " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return parse_config(j);
}
