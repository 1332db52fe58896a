#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <optional>

namespace cs::protocols::http {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

class Router;

class Session : public std::enable_shared_from_this<Session> {
public:
    static constexpr uint64_t BODY_LIMIT = 16 * 1024 * 1024;   // manifests and action lists, never file bytes

    // `openCount` is held up for the lifetime of the session
    Session(tcp::socket socket, std::shared_ptr<const Router> router,
            std::shared_ptr<std::atomic<size_t>> openCount);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    tcp::socket socket_;
    std::shared_ptr<const Router> router_;
    std::shared_ptr<std::atomic<size_t>> open_count_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
};

}
