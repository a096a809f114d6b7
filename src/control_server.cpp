#include "trafficgen/control_server.hpp"
#include "trafficgen/log.hpp"

#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace trafficgen {

struct ControlServer::Session
    : public std::enable_shared_from_this<ControlServer::Session> {
  tcp::socket socket;
  const StatusFn &status;
  const ReloadFn &reload;

  beast::flat_buffer buffer;
  http::request<http::string_body> req;
  http::response<http::string_body> res;

  Session(tcp::socket s, const StatusFn &st, const ReloadFn &rl)
      : socket(std::move(s)), status(st), reload(rl) {}

  void run() { read_request(); }

  void read_request() {
    auto self = shared_from_this();
    http::async_read(socket, buffer, req,
                     [self](beast::error_code ec, std::size_t) {
                       if (!ec)
                         self->handle_request();
                     });
  }

  void handle_request() {
    const auto target = req.target();
    try {
      if (req.method() == http::verb::get && target == "/status") {
        write_response(http::status::ok, status().dump());
        return;
      }
      if (req.method() == http::verb::post && target == "/funnels/reload") {
        const std::size_t n = reload();
        write_response(http::status::ok, json{{"loaded", n}}.dump());
        return;
      }
    } catch (const std::exception &e) {
      log_err("CTL", std::string("handler error: ") + e.what());
      write_response(http::status::internal_server_error,
                     json{{"error", e.what()}}.dump());
      return;
    }
    write_response(http::status::not_found, R"({"error":"not found"})");
  }

  void write_response(http::status code, std::string body) {
    res.version(req.version());
    res.keep_alive(false);
    res.result(code);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
    res.prepare_payload();

    auto self = shared_from_this();
    http::async_write(socket, res, [self](beast::error_code, std::size_t) {
      beast::error_code ec;
      self->socket.shutdown(tcp::socket::shutdown_send, ec);
    });
  }
};

ControlServer::ControlServer(net::io_context &ioc, const std::string &host,
                             unsigned short port, StatusFn status,
                             ReloadFn reload)
    : ioc_(ioc), acceptor_(ioc), socket_(ioc), status_(std::move(status)),
      reload_(std::move(reload)) {
  beast::error_code ec;
  const auto addr = net::ip::make_address(host, ec);
  if (ec)
    throw std::runtime_error("control endpoint: bad host '" + host + "'");
  tcp::endpoint ep{addr, port};
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec)
    throw std::runtime_error("control endpoint " + host + ":" +
                             std::to_string(port) + ": " + ec.message());
}

unsigned short ControlServer::port() const {
  return acceptor_.local_endpoint().port();
}

void ControlServer::run() {
  if (running_.exchange(true))
    return;
  do_accept();
}

void ControlServer::stop() {
  if (!running_.exchange(false))
    return;
  beast::error_code ec;
  acceptor_.close(ec);
}

void ControlServer::do_accept() {
  acceptor_.async_accept(socket_, [this](beast::error_code ec) {
    if (!ec)
      std::make_shared<Session>(std::move(socket_), status_, reload_)->run();
    if (running_)
      do_accept();
  });
}

} // namespace trafficgen
