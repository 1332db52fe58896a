#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "logging/LogRegistry.hpp"

using namespace cs::logging;

namespace cs::protocols::http {

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router,
                 std::shared_ptr<std::atomic<size_t>> openCount)
    : socket_(std::move(socket)), router_(std::move(router)), open_count_(std::move(openCount)) {
    ++*open_count_;
}

Session::~Session() { --*open_count_; }

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(BODY_LIMIT);

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Read error: {}", ec.message());
        return do_close();
    }

    auto req = parser_->release();
    LogRegistry::http()->debug("[HttpSession] Read {} bytes: {} {}", bytes,
                               std::string(req.method_string()), std::string(req.target()));

    const bool close = !req.keep_alive();
    auto msg = std::make_shared<string_response>(router_->route(std::move(req)));

    auto self = shared_from_this();
    http::async_write(socket_, *msg,
                      [self, msg, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    buffer_.consume(buffer_.size());
    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
