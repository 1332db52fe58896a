#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <string>

using namespace cs::protocols::http;
using namespace cs::logging;

namespace {

template <class Fn>
void withContext(const char* what, const tcp::endpoint& endpoint, Fn&& fn) {
    try {
        fn();
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string(what) + " " + endpoint.address().to_string() + ":" +
                                 std::to_string(endpoint.port()) + ": " + e.what());
    }
}

}

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const Router> router)
    : ioc_(ioc), acceptor_(ioc), router_(std::move(router)) {
    withContext("Failed to open", endpoint, [&] { acceptor_.open(endpoint.protocol()); });
    withContext("Failed to configure", endpoint, [&] { acceptor_.set_option(net::socket_base::reuse_address(true)); });
    withContext("Failed to bind", endpoint, [&] { acceptor_.bind(endpoint); });
    withContext("Failed to listen on", endpoint, [&] { acceptor_.listen(net::socket_base::max_listen_connections); });
}

void Server::run() {
    const auto ep = acceptor_.local_endpoint();
    LogRegistry::http()->info("[HttpServer] Listening on {}:{}", ep.address().to_string(), ep.port());
    doAccept();
}

void Server::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) LogRegistry::http()->warn("[HttpServer] Failed to close acceptor: {}", ec.message());
    LogRegistry::http()->info("[HttpServer] Stopped accepting after {} connections ({} still open)",
                              accepted_.load(), open_sessions_->load());
}

void Server::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_), [self = shared_from_this()](const beast::error_code& ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;   // stop()

        self->doAccept();

        if (ec) {
            LogRegistry::http()->debug("[HttpServer] Accept error: {}", ec.message());
            return;
        }

        ++self->accepted_;
        std::make_shared<Session>(std::move(socket), self->router_, self->open_sessions_)->run();
    });
}
