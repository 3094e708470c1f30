#include "TcpHealthCheck.hpp"

#include <stdexcept>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include "../models/Errors.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

TcpHealthCheck::TcpHealthCheck(std::chrono::milliseconds timeout,
                               CircuitBreakerConfig breaker_config,
                               std::shared_ptr<ILogger> logger,
                               std::shared_ptr<IClock> clock)
    : timeout_(timeout), breaker_config_(breaker_config), logger_(logger), clock_(clock) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for TcpHealthCheck");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null for TcpHealthCheck");
    }
}

std::pair<std::string, std::string> TcpHealthCheck::splitAddress(const std::string& address) {
    std::string rest = address;
    std::string default_port = "80";

    size_t scheme_pos = rest.find("://");
    if (scheme_pos != std::string::npos) {
        if (rest.compare(0, scheme_pos, "https") == 0) {
            default_port = "443";
        }
        rest = rest.substr(scheme_pos + 3);
    }
    size_t path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        rest = rest.substr(0, path_pos);
    }
    size_t at_pos = rest.rfind('@');
    if (at_pos != std::string::npos) {
        rest = rest.substr(at_pos + 1);
    }

    std::string host = rest;
    std::string port = default_port;
    size_t colon_pos = rest.rfind(':');
    if (colon_pos != std::string::npos) {
        host = rest.substr(0, colon_pos);
        port = rest.substr(colon_pos + 1);
    }
    if (host.empty() || port.empty()) {
        throw std::invalid_argument("Cannot parse proxy address: " + address);
    }
    return {host, port};
}

void TcpHealthCheck::connectOrThrow(const std::string& host, const std::string& port) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code result_ec = net::error::timed_out;

    resolver.async_resolve(host, port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                result_ec = ec;
                return;
            }
            stream.expires_after(timeout_);
            stream.async_connect(results, [&](beast::error_code connect_ec, const tcp::endpoint&) {
                result_ec = connect_ec;
            });
        });

    // Resolution has no timer of its own; bound the whole probe.
    ioc.run_for(timeout_ * 2);
    if (result_ec) {
        throw std::runtime_error("connect to " + host + ":" + port + " failed: " + result_ec.message());
    }
    beast::error_code close_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
}

bool TcpHealthCheck::probe(const std::string& address) {
    const std::pair<std::string, std::string> endpoint = splitAddress(address);
    auto it = breakers_.find(address);
    if (it == breakers_.end()) {
        it = breakers_.emplace(address, CircuitBreaker(breaker_config_, clock_)).first;
    }
    try {
        it->second.execute([&]() { connectOrThrow(endpoint.first, endpoint.second); });
        return true;
    } catch (const CircuitOpenError& e) {
        logger_->debug("Skipping probe of " + address + ": circuit open until " + std::to_string(e.retryAt()));
    } catch (const std::runtime_error& e) {
        logger_->debug("Probe of " + address + " failed: " + e.what());
    }
    return false;
}
