#pragma once

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pushfeed {
    struct EndPoint {
        std::string host;
        std::string port;
        std::string target; /// Can be both WS or REST target
    };

    /**
     * One bidirectional message connection attempt.
     *
     * A transport is single-use: connect() once, then exactly one close notification, whether the
     * attempt failed, the peer went away or close() was called. Callbacks may fire on any thread
     * of the io_context; owners marshal them onto their own strand.
     */
    class ITransport {
    public:
        using OpenHandler = std::function<void()>;
        using RawMessageHandler = std::function<void(const char *, std::size_t)>;
        using PongHandler = std::function<void()>;
        using CloseHandler = std::function<void(boost::system::error_code)>;

        virtual ~ITransport() = default;

        virtual void set_on_open(OpenHandler h) = 0;

        virtual void set_on_raw_message(RawMessageHandler h) = 0;

        /// Control-frame pong; text-level pongs arrive as messages.
        virtual void set_on_pong(PongHandler h) = 0;

        /// `ec` is the cause; a locally requested close reports boost::asio::error::operation_aborted.
        virtual void set_on_close(CloseHandler h) = 0;

        virtual void connect(const EndPoint &ep) = 0;

        /// Queued until open; dropped once closing.
        virtual void send_text(std::string text) = 0;

        virtual void send_ping() = 0;

        virtual void close() = 0;
    };

    using TransportFactory = std::function<std::shared_ptr<ITransport>()>;
} // namespace pushfeed
