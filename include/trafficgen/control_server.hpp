#pragma once
#include <boost/asio.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace trafficgen {

// HTTP-эндпоинт управления:
//   GET  /status          -> JSON статуса
//   POST /funnels/reload  -> {"loaded": n}
// остальное 404. Работает на переданном io_context.
class ControlServer {
public:
  using StatusFn = std::function<nlohmann::json()>;
  using ReloadFn = std::function<std::size_t()>;

  // бросает std::runtime_error, если порт не удалось занять
  ControlServer(boost::asio::io_context &ioc, const std::string &host,
                unsigned short port, StatusFn status, ReloadFn reload);

  void run();
  void stop();

  unsigned short port() const;

private:
  struct Session;
  void do_accept();

  boost::asio::io_context &ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::socket socket_;
  StatusFn status_;
  ReloadFn reload_;
  std::atomic<bool> running_{false};
};

} // namespace trafficgen
