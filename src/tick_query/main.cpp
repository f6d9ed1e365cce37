#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/timing.hpp"
#include "src/query/range_query.hpp"
#include "src/query/snapshot_query.hpp"
#include "src/registry/instrument_registry.hpp"
#include "src/store/tick_store.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace optick;

namespace {

struct QueryArgs {
    std::string command;
    std::string db_path = "resources/live_data.db";
    std::vector<std::string> chain_files;
    std::vector<std::string> instruments;
    std::optional<Date> date;
    std::optional<int> from_sec;
    std::optional<int> to_sec;
    std::optional<int> last_minutes;
    Field field = Field::LastPrice;
    int utc_offset_min = 330;
    int close_sec = 15 * 3600 + 30 * 60;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

void print_usage(const char* argv0) {
    std::cerr
        << "usage: " << argv0 << " snapshot [--chain FILE | --instrument ID]... [window]\n"
        << "       " << argv0 << " range --instrument ID --field NAME [--last MIN | window]\n"
        << "  --db PATH             tick store file (default resources/live_data.db)\n"
        << "  --date YYYY-MM-DD     session date (default today)\n"
        << "  --from HH:MM[:SS]     window start, exchange-local\n"
        << "  --to HH:MM[:SS]       window end, exchange-local\n"
        << "  --last MIN            range only: last MIN minutes (0 = whole day)\n"
        << "  --field NAME          ltp|cp|oi|iv|delta|gamma|vega|theta|chg_pct\n"
        << "  --utc-offset-min N    exchange UTC offset in minutes (default 330)\n"
        << "  --close HH:MM         nominal session close (default 15:30)\n"
        << "  --log-level LEVEL     trace|debug|info|warn|err|critical|off\n";
}

QueryArgs parse_args(const std::vector<std::string>& args) {
    if (args.empty() || (args[0] != "snapshot" && args[0] != "range")) {
        throw UsageError("expected a 'snapshot' or 'range' command");
    }

    QueryArgs q;
    q.command = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& flag = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError("missing value for " + flag);
            }
            return args[++i];
        };
        auto time_value = [&]() {
            const std::string& v = value();
            auto t = parse_time_of_day(v);
            if (!t) throw UsageError("bad time for " + flag + ": '" + v + "'");
            return *t;
        };

        if (flag == "--db") q.db_path = value();
        else if (flag == "--chain") q.chain_files.push_back(value());
        else if (flag == "--instrument") q.instruments.push_back(value());
        else if (flag == "--date") {
            const std::string& v = value();
            q.date = parse_date(v);
            if (!q.date) throw UsageError("bad date '" + v + "'");
        }
        else if (flag == "--from") q.from_sec = time_value();
        else if (flag == "--to") q.to_sec = time_value();
        else if (flag == "--close") q.close_sec = time_value();
        else if (flag == "--last") q.last_minutes = detail::to_int(flag, value(), 0);
        else if (flag == "--field") {
            const std::string& v = value();
            auto f = field_from_str(v);
            if (!f) throw UsageError("unknown field '" + v + "'");
            q.field = *f;
        }
        else if (flag == "--utc-offset-min") {
            const std::string& v = value();
            // offsets can be negative; shift into to_int's range
            q.utc_offset_min = detail::to_int(flag, v.empty() || v[0] != '-' ? v : v.substr(1), 0);
            if (!v.empty() && v[0] == '-') q.utc_offset_min = -q.utc_offset_min;
        }
        else if (flag == "--log-level") q.log_level = detail::to_level(value());
        else throw UsageError("unknown option " + flag);
    }

    if (q.command == "range" && q.instruments.size() != 1) {
        throw UsageError("range needs exactly one --instrument");
    }
    if (q.command == "range" && q.last_minutes && (q.from_sec || q.to_sec)) {
        throw UsageError("--last cannot be combined with --from/--to");
    }
    if (q.command == "snapshot" && q.last_minutes) {
        throw UsageError("--last applies to range only");
    }
    if (q.command == "snapshot" && q.instruments.empty() && q.chain_files.empty()) {
        throw UsageError("snapshot needs --chain or --instrument");
    }
    return q;
}

// [from, to] on the session date; open ends default to the whole day, capped at now
ExplicitWindow explicit_window(const QueryArgs& q, const SessionCalendar& cal, int64_t now) {
    const Date date = q.date.value_or(cal.local_date(now));
    ExplicitWindow w;
    w.start_ns = cal.local_to_ns(date, q.from_sec.value_or(0));
    if (q.to_sec) {
        w.end_ns = cal.local_to_ns(date, *q.to_sec);
    } else {
        w.end_ns = cal.local_to_ns(date, static_cast<int>(SEC_PER_DAY) - 1) + (NS_PER_SEC - 1);
        if (date == cal.local_date(now) && now < w.end_ns) {
            w.end_ns = now;
        }
    }
    return w;
}

std::string cell(const std::map<std::string, SnapshotRow>& rows,
                 const std::optional<std::string>& id, Field f, int precision) {
    if (!id) return "";
    auto it = rows.find(*id);
    if (it == rows.end()) return "-";
    const double v = f == Field::ChangePct ? it->second.change_pct : it->second.obs.fields.get(f);
    return fmt::format("{:.{}f}", v, precision);
}

int run_snapshot(const QueryArgs& q, const TickStore& store, const SessionCalendar& cal) {
    InstrumentRegistry registry;
    for (const auto& path : q.chain_files) registry.load_chain_file(path);
    for (const auto& id : q.instruments) registry.add_list(id);

    const ExplicitWindow w = explicit_window(q, cal, wall_clock_ns());
    SnapshotQuery query(store);
    const auto rows = query.snapshot(registry.instruments(), w.start_ns, w.end_ns);

    if (rows.empty()) {
        std::cerr << "no data in range " << cal.format_local(w.start_ns) << " .. "
                  << cal.format_local(w.end_ns) << "\n";
        return EXIT_SUCCESS;
    }

    const std::vector<std::string> strikes = registry.strikes();
    if (!strikes.empty()) {
        fmt::print("{:>8} {:>10} {:>10} {:>8} {:>8} {:>8} {:>8} {:>8} | {:^9} | "
                   "{:>8} {:>8} {:>8} {:>8} {:>8} {:>10} {:>10} {:>8}\n",
                   "Chg %", "Call OI", "Call LTP", "IV", "Delta", "Gamma", "Vega", "Theta",
                   "Strike",
                   "Theta", "Vega", "Gamma", "Delta", "IV", "Put LTP", "Put OI", "Chg %");
        for (const std::string& strike : strikes) {
            const StrikeLegs legs = registry.legs(strike);
            fmt::print("{:>8} {:>10} {:>10} {:>8} {:>8} {:>8} {:>8} {:>8} | {:^9} | "
                       "{:>8} {:>8} {:>8} {:>8} {:>8} {:>10} {:>10} {:>8}\n",
                       cell(rows, legs.call, Field::ChangePct, 1),
                       cell(rows, legs.call, Field::OpenInterest, 0),
                       cell(rows, legs.call, Field::LastPrice, 2),
                       cell(rows, legs.call, Field::ImpliedVol, 4),
                       cell(rows, legs.call, Field::Delta, 4),
                       cell(rows, legs.call, Field::Gamma, 4),
                       cell(rows, legs.call, Field::Vega, 4),
                       cell(rows, legs.call, Field::Theta, 4),
                       strike,
                       cell(rows, legs.put, Field::Theta, 4),
                       cell(rows, legs.put, Field::Vega, 4),
                       cell(rows, legs.put, Field::Gamma, 4),
                       cell(rows, legs.put, Field::Delta, 4),
                       cell(rows, legs.put, Field::ImpliedVol, 4),
                       cell(rows, legs.put, Field::LastPrice, 2),
                       cell(rows, legs.put, Field::OpenInterest, 0),
                       cell(rows, legs.put, Field::ChangePct, 1));
        }
    }

    // ids given directly, or chain legs without a strike row above
    for (const auto& kv : rows) {
        if (!strikes.empty() && registry.lookup(kv.first)) continue;
        const SnapshotRow& r = kv.second;
        const TickFields& f = r.obs.fields;
        fmt::print("{} {} ltp={:.2f} cp={:.2f} chg={:.2f}% oi={:.0f} iv={:.4f} "
                   "delta={:.4f} gamma={:.4f} vega={:.4f} theta={:.4f}\n",
                   cal.format_local(r.obs.ts_ns), kv.first, f.last_price, f.prev_close,
                   r.change_pct, f.open_interest, f.implied_vol, f.delta, f.gamma, f.vega,
                   f.theta);
    }
    return EXIT_SUCCESS;
}

int run_range(const QueryArgs& q, const TickStore& store, const SessionCalendar& cal) {
    RangeQuery query(store, cal);

    RangeWindow window;
    if (q.last_minutes) {
        RelativeWindow rel;
        rel.minutes = *q.last_minutes;
        rel.reference_date = q.date.value_or(cal.local_date(wall_clock_ns()));
        window = rel;
    } else {
        window = explicit_window(q, cal, wall_clock_ns());
    }

    const auto series = query.range(q.instruments.front(), q.field, window);
    if (series.empty()) {
        const ExplicitWindow w = query.resolve(window);
        std::cerr << "no data for " << q.instruments.front() << " " << field_to_str(q.field)
                  << " in " << cal.format_local(w.start_ns) << " .. "
                  << cal.format_local(w.end_ns) << "\n";
        return EXIT_SUCCESS;
    }

    fmt::print("timestamp,{}\n", field_to_str(q.field));
    for (const SeriesPoint& p : series) {
        fmt::print("{},{}\n", cal.format_local(p.ts_ns), p.value);
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    QueryArgs q;
    try {
        q = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    init_logging("tick_query", q.log_level);
    const SessionCalendar cal(q.utc_offset_min, q.close_sec);

    int rc = EXIT_SUCCESS;
    try {
        TickStore store(q.db_path, TickStore::Mode::ReadOnly);
        rc = q.command == "snapshot" ? run_snapshot(q, store, cal) : run_range(q, store, cal);
    } catch (const QueryError& e) {
        std::cerr << "query failed: " << e.what() << "\n";
        rc = 2;
    } catch (const RegistryError& e) {
        std::cerr << "cannot load instruments: " << e.what() << "\n";
        rc = 2;
    } catch (const StorageError& e) {
        std::cerr << "store error: " << e.what() << "\n";
        rc = EXIT_FAILURE;
    }

    spdlog::shutdown();
    return rc;
}
