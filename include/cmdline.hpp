#pragma once

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct CmdOptions {
    std::string venue; // required
    std::string scope; // "public" | "private"
    std::string market; // venue market line, e.g. spot, um, linear
    bool testnet{false};
    std::vector<std::string> topics; // "kind[:SYMBOL][:k=v,...]", repeatable
    std::optional<std::string> out; // JSON lines file, stdout if absent

    std::optional<std::string> ws_host; // override or std::nullopt
    std::optional<std::string> ws_port; // override or std::nullopt
    std::optional<std::string> ws_path; // override or std::nullopt
    std::optional<std::string> rest_host; // override or std::nullopt
    std::optional<std::string> rest_port; // override or std::nullopt

    std::string api_key; // --api-key or PUSHFEED_API_KEY
    std::string api_secret; // --api-secret or PUSHFEED_API_SECRET

    int ping_interval_ms{0}; // 0 = venue default
    int max_auth_failures{0}; // 0 = never give up
    bool debug_raw{false};
    bool verbose{false};

    bool show_help{false};
};

inline std::string env_or_empty(const char *name) {
    const char *v = std::getenv(name);
    return v ? std::string(v) : std::string{};
}

inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
    namespace po = boost::program_options;

    po::options_description desc("Options");
    desc.add_options()
            ("help,h", "Show this help message")
            ("venue,v", po::value<std::string>()->required(),
             "Venue name (binance, bybit, hyperliquid)")
            ("scope", po::value<std::string>()->default_value("public"),
             "Feed scope: public, private")
            ("market,m", po::value<std::string>()->default_value("spot"),
             "Market line: binance spot|um|cm|pm, bybit spot|linear|inverse|option")
            ("testnet", po::bool_switch(), "Use the venue testnet")
            ("topic,t", po::value<std::vector<std::string> >()->composing(),
             "Topic kind[:SYMBOL][:k=v,...], repeatable (e.g. depth:BTCUSDT:levels=5)")
            ("out,o", po::value<std::string>(), "Write JSON lines to this file instead of stdout")
            ("ws_host", po::value<std::string>(), "Optional WebSocket host override")
            ("ws_port", po::value<std::string>(), "Optional WebSocket port override")
            ("ws_path", po::value<std::string>(), "Optional WebSocket path override")
            ("rest_host", po::value<std::string>(), "Optional REST host override")
            ("rest_port", po::value<std::string>(), "Optional REST port override")
            ("api-key", po::value<std::string>(), "API key (default: $PUSHFEED_API_KEY)")
            ("api-secret", po::value<std::string>(), "API secret (default: $PUSHFEED_API_SECRET)")
            ("ping-interval", po::value<int>()->default_value(0), "Heartbeat interval in ms, 0 = venue default")
            ("max-auth-failures", po::value<int>()->default_value(0),
             "Stop after N consecutive authentication failures, 0 = never")
            ("debug-raw", po::bool_switch(), "Log raw inbound frames")
            ("verbose", po::bool_switch(), "Log at DEBUG level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0]
                    << " --venue VENUE [--scope public|private] [--market MARKET] "
                    "--topic KIND[:SYMBOL][:k=v] [--topic ...] [--out FILE]\n\n";
            std::cout << desc << "\n";
            out.show_help = true;
            return true;
        }

        // Enforce required options
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error parsing command line: " << e.what() << "\n\n";
        std::cerr << desc << "\n";
        return false;
    }

    out.venue = vm["venue"].as<std::string>();
    out.scope = vm["scope"].as<std::string>();
    out.market = vm["market"].as<std::string>();
    out.testnet = vm["testnet"].as<bool>();
    if (vm.contains("topic")) out.topics = vm["topic"].as<std::vector<std::string> >();
    if (vm.contains("out")) out.out = vm["out"].as<std::string>();
    if (vm.contains("ws_host")) out.ws_host = vm["ws_host"].as<std::string>();
    if (vm.contains("ws_port")) out.ws_port = vm["ws_port"].as<std::string>();
    if (vm.contains("ws_path")) out.ws_path = vm["ws_path"].as<std::string>();
    if (vm.contains("rest_host")) out.rest_host = vm["rest_host"].as<std::string>();
    if (vm.contains("rest_port")) out.rest_port = vm["rest_port"].as<std::string>();

    out.api_key = vm.contains("api-key") ? vm["api-key"].as<std::string>() : env_or_empty("PUSHFEED_API_KEY");
    out.api_secret = vm.contains("api-secret")
                         ? vm["api-secret"].as<std::string>()
                         : env_or_empty("PUSHFEED_API_SECRET");

    out.ping_interval_ms = vm["ping-interval"].as<int>();
    out.max_auth_failures = vm["max-auth-failures"].as<int>();
    out.debug_raw = vm["debug-raw"].as<bool>();
    out.verbose = vm["verbose"].as<bool>();

    return true;
}
