// tradegate-sim - drive the trading engine from the command line
//
// Wires in-memory feeds, paper custody and a queued prediction bridge around
// the engine. The clock only moves on `advance`.

#include "tradegate/authorizer.hpp"
#include "tradegate/bridge.hpp"
#include "tradegate/compliance.hpp"
#include "tradegate/config.hpp"
#include "tradegate/events.hpp"
#include "tradegate/logging.hpp"
#include "tradegate/prediction.hpp"
#include "tradegate/reward.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace tradegate;

//------------------------------------------------------------------------------
// Configuration
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    Actor actor;
    std::string log_level;
    bool interactive = true;
    std::vector<std::string> command_args;
};

// "simulation" block of the config file
struct SimSettings {
    Timestamp start_time = 1700000000;
    Price initial_price = static_cast<Price>(2500) * 100000000;
    U128 custody_rate_e8 = static_cast<U128>(2500) * 100000000;
    uint64_t performance_fee_bps = 200;
    Amount initial_deposit = 10000 * E18;
    std::string compliance = "on";
};

SimSettings read_sim_settings(const json& root) {
    SimSettings s;
    if (!root.contains("simulation")) return s;

    const auto& j = root.at("simulation");
    s.start_time = j.value("start_time", s.start_time);
    if (j.contains("initial_price")) s.initial_price = parse_price(j.at("initial_price").get<std::string>());
    if (j.contains("custody_rate")) s.custody_rate_e8 = parse_amount(j.at("custody_rate").get<std::string>());
    s.performance_fee_bps = j.value("performance_fee_bps", s.performance_fee_bps);
    if (j.contains("initial_deposit")) s.initial_deposit = parse_amount(j.at("initial_deposit").get<std::string>());
    s.compliance = j.value("compliance", s.compliance);
    return s;
}

AgentConfig default_agent_config() {
    AgentConfig cfg;
    cfg.source_asset = address::from_hex("0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    cfg.target_asset = address::from_hex("0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
    return cfg;
}

//------------------------------------------------------------------------------
// Simulator
//------------------------------------------------------------------------------

class Simulator {
public:
    Simulator(const AgentConfig& config, const SimSettings& settings, Actor actor)
        : actor_(std::move(actor))
        , clock_(settings.start_time)
        , price_feed_(std::make_shared<ManualFeed>("ETH / USD", settings.initial_price,
                                                   settings.start_time))
        , eco_feed_(std::make_shared<ManualFeed>("eco score", 0, settings.start_time))
        , volatility_feed_(std::make_shared<ManualFeed>("volatility bps", 0, settings.start_time))
        , custody_(clock_, settings.custody_rate_e8, settings.performance_fee_bps)
        , authorizer_(config, clock_, price_feed_, custody_, &sink_)
        , compliance_(settings.compliance == "off"
                          ? std::shared_ptr<ComplianceGate>()
                          : std::make_shared<ComplianceEngine>(volatility_feed_, nullptr))
        , lifecycle_(authorizer_, bridge_, rewards_, compliance_, config.prediction_source)
    {
        sink_.add_listener(&log_listener_);
        custody_.deposit(config.source_asset, settings.initial_deposit);
    }

    json execute(const std::vector<std::string>& args) {
        const std::string& cmd = args[0];

        if (cmd == "price") {
            require_args(args, 2, "price <value>");
            price_feed_->update(parse_price(args[1]), clock_.now());
            return {{"price", args[1]}, {"updated_at", clock_.now()}};
        }
        if (cmd == "eco") {
            require_args(args, 2, "eco <score|off>");
            if (args[1] == "off") {
                authorizer_.set_eco_feed(actor_, nullptr);
                return {{"eco", "off"}};
            }
            eco_feed_->update(parse_price(args[1]), clock_.now());
            authorizer_.set_eco_feed(actor_, eco_feed_);
            return {{"eco_score", authorizer_.eco_score()}};
        }
        if (cmd == "volatility") {
            require_args(args, 2, "volatility <bps>");
            volatility_feed_->update(parse_price(args[1]), clock_.now());
            return {{"volatility_bps", args[1]}};
        }
        if (cmd == "advance") {
            require_args(args, 2, "advance <seconds>");
            clock_.advance(std::stoull(args[1]));
            return {{"now", clock_.now()}};
        }
        if (cmd == "trade") {
            require_args(args, 3, "trade <amount> <confidence_bps> [min_out]");
            Amount min_out = args.size() > 3 ? parse_amount(args[3]) : 0;
            auto result = authorizer_.trigger_trade(actor_, parse_amount(args[1]), min_out,
                                                    deadline(), std::stoull(args[2]));
            return trade_json(result);
        }
        if (cmd == "batch") {
            require_args(args, 3, "batch <confidence_bps> <amount> [amount...]");
            std::vector<Amount> amounts;
            for (size_t i = 2; i < args.size(); ++i) {
                amounts.push_back(parse_amount(args[i]));
            }
            std::vector<Amount> mins(amounts.size(), 0);
            auto result = authorizer_.trigger_batch_trade(actor_, amounts, mins, deadline(),
                                                          std::stoull(args[1]));
            json elements = json::array();
            for (const auto& e : result.elements) {
                json item = {{"index", e.index}, {"amount_in", format_units(e.amount_in)}};
                if (e.skipped) item["skipped"] = true;
                if (e.result) item["trade"] = trade_json(*e.result);
                if (!e.error.empty()) item["error"] = e.error;
                elements.push_back(item);
            }
            return {{"executed", result.executed}, {"failed", result.failed},
                    {"elements", elements}};
        }
        if (cmd == "can_trade") {
            require_args(args, 3, "can_trade <amount> <confidence_bps>");
            auto e = authorizer_.can_trade(parse_amount(args[1]), std::stoull(args[2]));
            return {{"allowed", e.allowed}, {"reason", to_string(e.reason)},
                    {"message", e.message}};
        }
        if (cmd == "predict") {
            return {{"request_id", lifecycle_.request_prediction(actor_)}};
        }
        if (cmd == "fulfill") {
            return fulfill(args);
        }
        if (cmd == "upkeep") {
            auto check = lifecycle_.check_upkeep();
            if (!check.needed) {
                return {{"upkeep_needed", false}};
            }
            auto id = lifecycle_.perform_upkeep(actor_, check.perform_data);
            return {{"upkeep_needed", true}, {"request_id", id}};
        }
        if (cmd == "stop") {
            std::string reason = args.size() > 1 ? join(args, 1) : "manual stop";
            authorizer_.emergency_stop(actor_, reason);
            return {{"emergency_stop", true}, {"reason", reason}};
        }
        if (cmd == "resume") {
            authorizer_.resume_trading(actor_);
            return {{"emergency_stop", false}};
        }
        if (cmd == "pause") {
            authorizer_.pause(actor_);
            return {{"paused", true}};
        }
        if (cmd == "unpause") {
            authorizer_.unpause(actor_);
            return {{"paused", false}};
        }
        if (cmd == "reset_pending") {
            lifecycle_.reset_pending_request(actor_);
            return {{"pending_requests", lifecycle_.pending_requests()}};
        }
        if (cmd == "claim") {
            require_args(args, 3, "claim <token_id> <recipient>");
            lifecycle_.claim_reward(actor_, std::stoull(args[1]), args[2]);
            return {{"claimed", std::stoull(args[1])}, {"recipient", args[2]}};
        }
        if (cmd == "stats") {
            return stats();
        }

        throw std::invalid_argument("Unknown command: " + cmd + ". Type 'help' for commands.");
    }

private:
    static void require_args(const std::vector<std::string>& args, size_t n,
                             const char* usage) {
        if (args.size() < n) {
            throw std::invalid_argument(std::string("Usage: ") + usage);
        }
    }

    static std::string join(const std::vector<std::string>& args, size_t from) {
        std::string out;
        for (size_t i = from; i < args.size(); ++i) {
            if (!out.empty()) out += ' ';
            out += args[i];
        }
        return out;
    }

    Timestamp deadline() const { return clock_.now() + limits::PREDICTION_TRADE_DEADLINE; }

    static json trade_json(const TradeResult& r) {
        return {{"sequence", r.sequence},
                {"price", to_string(r.price.price)},
                {"unconfirmed", r.price.unconfirmed},
                {"amount_in", format_units(r.receipt.amount_in)},
                {"amount_out", format_units(r.receipt.amount_out)},
                {"fee", format_units(r.receipt.fee)}};
    }

    // fulfill <price> <confidence_bps> [anomaly] | fulfill error <message>
    json fulfill(const std::vector<std::string>& args) {
        auto pending = lifecycle_.pending_request_id();
        if (!pending) {
            throw TradeError(Reason::NO_PENDING_REQUEST);
        }

        FulfillOutcome outcome;
        if (args.size() > 1 && args[1] == "error") {
            outcome = lifecycle_.fulfill(*pending, {}, args.size() > 2 ? join(args, 2) : "error");
        } else {
            require_args(args, 3, "fulfill <price> <confidence_bps> [anomaly]");
            bool anomaly = args.size() > 3 && (args[3] == "1" || args[3] == "anomaly");
            auto payload = abi::encode({parse_price(args[1]), parse_price(args[2]),
                                        static_cast<I128>(anomaly ? 1 : 0)});
            outcome = lifecycle_.fulfill(*pending, payload, "");
        }

        auto request = lifecycle_.request(*pending);
        json out = {{"request_id", *pending}, {"outcome", to_string(outcome)}};
        if (request) out["executed"] = request->executed;
        return out;
    }

    json stats() const {
        auto t = authorizer_.trading_stats();
        auto a = lifecycle_.advanced_stats();
        auto state = authorizer_.rate_state();
        auto path = authorizer_.path();
        return {
            {"now", clock_.now()},
            {"total_trades", t.total_trades},
            {"successful_trades", t.successful_trades},
            {"success_rate_bps", t.success_rate_bps},
            {"daily_volume", format_units(state.daily_trade_volume)},
            {"last_valid_price", to_string(authorizer_.last_valid_price())},
            {"emergency_stop", authorizer_.emergency().is_stopped()},
            {"paused", authorizer_.emergency().is_paused()},
            {"total_predictions", a.total_predictions},
            {"predictions_fulfilled", a.predictions_fulfilled},
            {"rewards_minted", a.rewards_minted},
            {"pending_requests", a.pending_requests},
            {"last_prediction_time", a.last_prediction_time},
            {"source_balance", format_units(custody_.balance(path.front()))},
            {"target_balance", format_units(custody_.balance(path.back()))},
        };
    }

    Actor actor_;
    ManualClock clock_;
    std::shared_ptr<ManualFeed> price_feed_;
    std::shared_ptr<ManualFeed> eco_feed_;
    std::shared_ptr<ManualFeed> volatility_feed_;
    PaperCustody custody_;
    QueuedBridge bridge_;
    RewardLedger rewards_;
    EventSink sink_;
    LogEventListener log_listener_;
    TradeAuthorizer authorizer_;
    std::shared_ptr<ComplianceGate> compliance_;
    PredictionLifecycle lifecycle_;
};

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_help() {
    std::cout << R"(
tradegate-sim commands:

  price <value>                      Set the oracle price (e.g. 2500e8)
  eco <score|off>                    Set or remove the eco score feed
  volatility <bps>                   Set the volatility reading used by compliance
  advance <seconds>                  Move the clock forward
  trade <amount> <confidence> [min]  Trigger a trade (e.g. trade 50e18 8000)
  batch <confidence> <amount>...     Trigger a batch of up to 10 trades
  can_trade <amount> <confidence>    Check eligibility without trading
  predict                            Request a price prediction
  fulfill <price> <confidence> [anomaly]
  fulfill error <message>            Deliver the pending prediction
  upkeep                             Run the scheduled prediction trigger
  stop [reason]                      Activate the emergency stop
  resume                             Deactivate the emergency stop
  pause / unpause                    Toggle the pause flag
  reset_pending                      Expire a timed out prediction request
  claim <token_id> <recipient>       Claim a reward token
  stats                              Show trading and prediction statistics
  help                               Show this help message
  quit / exit                        Exit the simulator
)";
}

std::vector<std::string> split(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

void run_interactive(Simulator& sim) {
    std::cout << "tradegate-sim - Type 'help' for commands\n> ";

    std::string line;
    while (std::getline(std::cin, line)) {
        auto parts = split(line);
        if (parts.empty()) {
            std::cout << "> ";
            continue;
        }

        auto& cmd = parts[0];
        for (auto& c : cmd) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        if (cmd == "help") {
            print_help();
        } else if (cmd == "quit" || cmd == "exit") {
            std::cout << "Goodbye\n";
            break;
        } else {
            try {
                std::cout << sim.execute(parts).dump(2) << "\n";
            } catch (const std::exception& e) {
                std::cout << "Error: " << e.what() << "\n";
            }
        }

        std::cout << "> ";
    }
}

int run_command(Simulator& sim, const std::vector<std::string>& args) {
    if (args[0] == "help") {
        print_help();
        return 0;
    }
    try {
        std::cout << sim.execute(args).dump(2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

void print_usage(const char* prog) {
    std::cout << "tradegate-sim - risk-gated trading engine simulator\n\n"
              << "Usage: " << prog << " [options] [command] [args...]\n\n"
              << "Options:\n"
              << "  -c, --config <file>   Agent config JSON (default: built-in settings)\n"
              << "  -a, --actor <name>    Actor issuing commands (default: config admin)\n"
              << "  -l, --log-level <lvl> debug, info, warn or error\n"
              << "  -i, --interactive     Interactive mode (default if no command)\n"
              << "  -h, --help            Show this help message\n\n"
              << "Examples:\n"
              << "  " << prog << " -c config/agent.example.json\n"
              << "  " << prog << " can_trade 50e18 8000\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-a" || arg == "--actor") {
            if (i + 1 >= argc) {
                std::cerr << "Missing actor name\n";
                std::exit(1);
            }
            options.actor = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-i" || arg == "--interactive") {
            options.interactive = true;
        } else if (arg[0] != '-') {
            options.interactive = false;
            while (i < argc) {
                options.command_args.push_back(argv[i++]);
            }
            break;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.command_args.empty()) {
        options.interactive = true;
    }
    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    AgentConfig config;
    SimSettings settings;
    try {
        if (options.config_path.empty()) {
            config = default_agent_config();
        } else {
            config = AgentConfig::from_file(options.config_path);
            std::ifstream file(options.config_path);
            settings = read_sim_settings(json::parse(file));
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    setup_logging(options.log_level.empty() ? config.log_level : options.log_level);
    Actor actor = options.actor.empty() ? config.admin : options.actor;

    try {
        Simulator sim(config, settings, actor);
        spdlog::info("Simulator ready, acting as '{}'", actor);

        if (options.interactive) {
            run_interactive(sim);
            return 0;
        }
        return run_command(sim, options.command_args);
    } catch (const std::exception& e) {
        spdlog::error("Simulator failed: {}", e.what());
        return 1;
    }
}
