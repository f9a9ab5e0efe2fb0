#include "cmdline.hpp"                 // CmdOptions, parse_cmdline
#include "pushfeed/Topic.hpp"          // parseTopic
#include "utils/VenueUtils.hpp"        // parseVenue, parseScope
#include "venue_factory.hpp"           // VenueFactory

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>

int main(int argc, char **argv) {
    CmdOptions options;
    if (!parse_cmdline(argc, argv, options)) {
        // parse_cmdline already printed error/help on failure
        return 1;
    }

    if (options.show_help) {
        return 0;
    }

    // ---------------------------------------------------------------------
    // 1) Validate venue / scope / market
    // ---------------------------------------------------------------------
    const pushfeed::VenueId venue = pushfeed::venue::parseVenue(options.venue);
    if (venue == pushfeed::VenueId::UNKNOWN) {
        std::cerr << "Error: unknown venue '" << options.venue
                << "'. Expected one of: binance, bybit, hyperliquid.\n";
        return 1;
    }

    const auto scope = pushfeed::venue::parseScope(options.scope);
    if (!scope) {
        std::cerr << "Error: unknown scope '" << options.scope << "'. Expected public or private.\n";
        return 1;
    }

    if (!pushfeed::venue::isKnownMarket(venue, options.market)) {
        std::cerr << "Error: market '" << options.market << "' is not known for "
                << pushfeed::to_string(venue) << "\n";
        return 1;
    }

    // ---------------------------------------------------------------------
    // 2) Topics
    // ---------------------------------------------------------------------
    std::vector<pushfeed::Topic> topics;
    for (const auto &text: options.topics) {
        auto t = pushfeed::parseTopic(text);
        if (!t) {
            std::cerr << "Error: cannot parse topic '" << text << "'\n";
            return 1;
        }
        topics.push_back(std::move(*t));
    }
    if (topics.empty()) {
        std::cerr << "Error: at least one --topic is required\n";
        return 1;
    }

    // ---------------------------------------------------------------------
    // 3) Build StreamConfig from CLI options
    // ---------------------------------------------------------------------
    pushfeed::StreamConfig cfg;
    cfg.venue = venue;
    cfg.scope = *scope;
    cfg.market = options.market;
    cfg.testnet = options.testnet;
    cfg.ws_host = options.ws_host.value_or("");
    cfg.ws_port = options.ws_port.value_or("");
    cfg.ws_path = options.ws_path.value_or("");
    cfg.rest_host = options.rest_host.value_or("");
    cfg.rest_port = options.rest_port.value_or("");
    cfg.api_key = options.api_key;
    cfg.api_secret = options.api_secret;
    cfg.ping_interval = std::chrono::milliseconds(options.ping_interval_ms);
    cfg.max_consecutive_auth_failures = static_cast<std::size_t>(std::max(0, options.max_auth_failures));

    pushfeed::debug::raw.store(options.debug_raw);

    std::cerr << "[PUSHFEED] Starting stream\n"
            << "  venue    = " << pushfeed::to_string(cfg.venue) << "\n"
            << "  scope    = " << pushfeed::to_string(cfg.scope) << "\n"
            << "  market   = " << cfg.market << (cfg.testnet ? " (testnet)" : "") << "\n"
            << "  topics   = " << topics.size() << "\n"
            << "  ws_host  = " << (cfg.ws_host.empty() ? "<default>" : cfg.ws_host) << "\n"
            << "  ws_port  = " << (cfg.ws_port.empty() ? "<default>" : cfg.ws_port) << "\n"
            << "  out      = " << options.out.value_or("<stdout>") << "\n";

    // ---------------------------------------------------------------------
    // 4) Output sink
    // ---------------------------------------------------------------------
    std::ofstream file;
    if (options.out) {
        file.open(*options.out, std::ios::out | std::ios::app);
        if (!file) {
            std::cerr << "Error: cannot open " << *options.out << " for writing\n";
            return 1;
        }
    }
    std::ostream &sink = options.out ? static_cast<std::ostream &>(file) : std::cout;
    std::mutex sink_mtx;

    auto writeLine = [&](const pushfeed::StreamMessage &msg) {
        nlohmann::json line;
        line["key"] = msg.key;
        line["channel"] = msg.channel;
        line["ts"] = msg.recv_ts_ns;
        line["data"] = msg.data;

        std::lock_guard lock(sink_mtx);
        sink << line.dump() << '\n';
        sink.flush();
    };

    // ---------------------------------------------------------------------
    // 5) Event loop + connection manager
    // ---------------------------------------------------------------------
    boost::asio::io_context ioc;

    pushfeed::StreamObserver observer;
    observer.log = pushfeed::stderrLogger(options.verbose || options.debug_raw
                                              ? pushfeed::LogLevel::DEBUG
                                              : pushfeed::LogLevel::INFO);
    observer.on_error = [log = observer.log](pushfeed::ErrorKind kind, std::string_view msg) {
        log(pushfeed::LogLevel::WARN, std::string("[") + pushfeed::to_string(kind) + "] " + std::string(msg));
    };

    auto mgr = pushfeed::VenueFactory::create(ioc, cfg, observer);
    if (!mgr) {
        std::cerr << "Failed to create stream for venue=" << pushfeed::to_string(cfg.venue)
                << " (check market and API credentials)\n";
        return 1;
    }

    mgr->setDefaultHandler(writeLine);
    for (const auto &t: topics) {
        const pushfeed::Status st = mgr->subscribe(t, writeLine);
        if (st != pushfeed::Status::OK) {
            std::cerr << "subscribe(" << pushfeed::makeTopicKey(t) << ") failed: " << pushfeed::to_string(st) << "\n";
            return 1;
        }
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int) {
        if (ec) return;
        // run() returns once the close handshake and revoke completed; a second signal kills the process
        mgr->stop();
        boost::system::error_code ignored;
        signals.clear(ignored);
    });

    if (mgr->start() != pushfeed::Status::OK) {
        std::cerr << "start() failed\n";
        return 1;
    }

    ioc.run();

    const auto s = mgr->stats();
    std::cerr << "[PUSHFEED] frames=" << s.dispatch.frames
            << " delivered=" << s.dispatch.delivered
            << " connections=" << s.connections
            << " reconnects=" << s.reconnect_attempts << "\n";
    return 0;
}
