#ifndef RATELIMITMIDDLEWARE_HPP
#define RATELIMITMIDDLEWARE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http.hpp>

#include "../models/RequestContext.hpp"
#include "RateLimiter.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

// Header set by the authentication layer in front of us.
static constexpr auto USER_ID_HEADER = "X-User-Id";

// Builds the limiter's view of an HTTP request. The endpoint is the target
// path without its query string.
inline RequestContext makeRequestContext(const http::request<http::string_body>& req,
                                         const std::string& client_address) {
    RequestContext context;
    std::string_view target_path(req.target().data(), req.target().size());
    size_t query_pos = target_path.find('?');
    if (query_pos != std::string_view::npos) {
        target_path = target_path.substr(0, query_pos);
    }
    context.endpoint = target_path.empty() ? std::string("/") : std::string(target_path);

    auto user_it = req.find(USER_ID_HEADER);
    if (user_it != req.end() && !user_it->value().empty()) {
        context.authenticated = true;
        context.user_id = std::string(user_it->value().data(), user_it->value().size());
    }
    if (!client_address.empty()) {
        context.client_address = client_address;
    }
    return context;
}

// Runs RateLimiter::check before the wrapped handler. RateLimitExceededError
// propagates to the caller untouched.
template <typename Response>
class RateLimitMiddleware {
public:
    using Handler = std::function<Response(const RequestContext&)>;

    RateLimitMiddleware(std::shared_ptr<RateLimiter> limiter, Handler handler)
        : limiter_(std::move(limiter)), handler_(std::move(handler)) {
        if (!limiter_) {
            throw std::invalid_argument("RateLimiter cannot be null for RateLimitMiddleware");
        }
        if (!handler_) {
            throw std::invalid_argument("Handler cannot be empty for RateLimitMiddleware");
        }
    }

    Response operator()(const RequestContext& context) {
        const CallerClass caller_class =
            context.authenticated ? CallerClass::Authenticated : CallerClass::Anonymous;
        std::optional<std::string> identifier = context.user_id ? context.user_id : context.client_address;

        limiter_->check(context.endpoint, caller_class, identifier);
        return handler_(context);
    }

private:
    std::shared_ptr<RateLimiter> limiter_;
    Handler handler_;
};

#endif // RATELIMITMIDDLEWARE_HPP
