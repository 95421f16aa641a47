#include "codec/json_codec.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/matching_engine.hpp"
#include "output/trade_logger.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>   Load configuration from JSON file\n"
              << "  -o, --orders <path>   Load a JSON book {\"buys\":[...],\"sells\":[...]}\n"
              << "  -p, --product <id>    Product to match (default 1)\n"
              << "  -u, --update <price>  Apply a price update after matching\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  MATCHCORE_PRICE_TOLERANCE  Price tolerance for updates\n"
              << "  MATCHCORE_LOG_LEVEL        spdlog level (trace..critical, off)\n"
              << "  MATCHCORE_LOG_ASYNC        1/true for async logging\n"
              << "  MATCHCORE_LOG_QUEUE_SIZE   Async logger queue size\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "matchcore v1.0.0\n"
              << "In-memory order matching core\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> orders_path;
    std::optional<matchcore::ProductId> product_id;
    std::optional<matchcore::Price> update_price;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-o" || arg == "--orders") && i + 1 < argc) {
            args.orders_path = argv[++i];
        } else if ((arg == "-p" || arg == "--product") && i + 1 < argc) {
            args.product_id = std::stoll(argv[++i]);
        } else if ((arg == "-u" || arg == "--update") && i + 1 < argc) {
            args.update_price = std::stod(argv[++i]);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return args;
}

/// The sample book the matching core has always been demonstrated with
matchcore::BookSnapshot builtin_book(matchcore::ProductId product_id) {
    using matchcore::Order;
    using matchcore::OrderKind;

    const auto now = std::chrono::system_clock::now();
    auto make = [&](matchcore::OrderId id, OrderKind kind, double price, double amount, int priority) {
        return Order{
            .id = id,
            .kind = kind,
            .price = price,
            .amount = amount,
            .priority = priority,
            .created_at = now,
            .product_id = product_id
        };
    };

    matchcore::BookSnapshot book;
    book.product_id = product_id;
    book.buys = {
        make(1, OrderKind::Limit, 10.0, 5.0, 5),
        make(2, OrderKind::Market, 0.0, 3.0, 3),
        make(3, OrderKind::Limit, 12.0, 7.0, 8)
    };
    book.sells = {
        make(4, OrderKind::Limit, 11.5, 10.0, 4),
        make(5, OrderKind::Market, 0.0, 5.0, 6)
    };
    return book;
}

matchcore::Result<matchcore::BookSnapshot> load_book(const matchcore::JsonCodec& codec,
                                                     const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return matchcore::Result<matchcore::BookSnapshot>::Err(matchcore::Error{
            matchcore::ErrorKind::Decoding, "Failed to open orders file: " + path});
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return codec.decode_book(matchcore::JsonCodec::to_bytes(buffer.str()));
}

}  // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 2;
    }

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = matchcore::Config::load(args.config_path);

    // CLI argument overrides (highest priority)
    if (args.orders_path) {
        config.demo.orders_file = args.orders_path;
    }
    if (args.product_id) {
        config.demo.product_id = *args.product_id;
    }
    if (args.update_price) {
        config.demo.update_price = args.update_price;
    }

    try {
        matchcore::logging::setup(config.logging);

        auto codec = std::make_shared<matchcore::JsonCodec>();
        matchcore::MatchingEngine engine(config, codec);
        const auto product = config.demo.product_id;

        matchcore::BookSnapshot initial;
        if (config.demo.orders_file) {
            auto loaded = load_book(*codec, *config.demo.orders_file);
            if (loaded.is_err()) {
                spdlog::error("{}", loaded.error().describe());
                return 1;
            }
            initial = loaded.value();
        } else {
            initial = builtin_book(product);
        }

        // Orders in a loaded book are routed by their own product_id
        for (const auto& order : initial.buys) {
            engine.add_buy(order);
        }
        for (const auto& order : initial.sells) {
            engine.add_sell(order);
        }

        matchcore::output::TradeLogger::log_book("Initial Order Book", engine.snapshot(product));

        auto summary = engine.match(product);
        matchcore::output::TradeLogger::log_match(summary);
        matchcore::output::TradeLogger::log_book("Final Order Book", engine.snapshot(product));

        engine.cancel_buy(product, 2);
        engine.cancel_sell(product, 5);
        matchcore::output::TradeLogger::log_book("Order Book after Cancellation", engine.snapshot(product));

        if (config.demo.update_price) {
            engine.update_price(product, *config.demo.update_price);
            matchcore::output::TradeLogger::log_book("Order Book after Price Update", engine.snapshot(product));
        }

        auto encoded = engine.encode_book(product);
        if (encoded.is_err()) {
            spdlog::error("{}", encoded.error().describe());
            return 1;
        }
        std::cout << matchcore::JsonCodec::to_string(encoded.value()) << std::endl;

        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
