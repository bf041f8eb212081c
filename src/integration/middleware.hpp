#pragma once

#include <utility>
#include <connection/connection_manager.hpp>

// Runs each request inside a connection scope, so every lock taken while
// handling it shares one coordination-service session.
//
//   auto app = ConnectionMiddleware<Handler>(handler);
//   Response r = app(request);
template <typename Handler>
class ConnectionMiddleware {
public:
    explicit ConnectionMiddleware(Handler get_response)
        : get_response_(std::move(get_response)) {}

    template <typename Request>
    auto operator()(Request&& request) {
        return ConnectionManager().run([&] {
            return get_response_(std::forward<Request>(request));
        });
    }

private:
    Handler get_response_;
};

template <typename Handler>
ConnectionMiddleware<Handler> with_connection_scope(Handler handler) {
    return ConnectionMiddleware<Handler>(std::move(handler));
}
