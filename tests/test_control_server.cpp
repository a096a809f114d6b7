#include <gtest/gtest.h>
#include <trafficgen/control_server.hpp>

#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/thread.hpp>
#include <nlohmann/json.hpp>

using namespace trafficgen;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

http::response<http::string_body> request(unsigned short port, http::verb verb,
                                          const std::string &target) {
  net::io_context ioc;
  tcp::socket socket(ioc);
  socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

  http::request<http::empty_body> req{verb, target, 11};
  req.set(http::field::host, "127.0.0.1");
  http::write(socket, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

class ControlServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_ = std::make_unique<ControlServer>(
        ioc_, "127.0.0.1", 0,
        [] { return json{{"visits_total", 12}}; },
        [this] {
          ++reloads_;
          return std::size_t{3};
        });
    server_->run();
    thread_ = boost::thread([this] { ioc_.run(); });
  }

  void TearDown() override {
    server_->stop();
    ioc_.stop();
    thread_.join();
  }

  net::io_context ioc_;
  std::unique_ptr<ControlServer> server_;
  boost::thread thread_;
  int reloads_{0};
};

} // namespace

TEST_F(ControlServerTest, StatusReturnsJson) {
  const auto res = request(server_->port(), http::verb::get, "/status");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json::parse(res.body())["visits_total"], 12);
}

TEST_F(ControlServerTest, ReloadCallsRegistry) {
  const auto res = request(server_->port(), http::verb::post, "/funnels/reload");
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json::parse(res.body())["loaded"], 3);
  EXPECT_EQ(reloads_, 1);
}

TEST_F(ControlServerTest, UnknownRouteIs404) {
  EXPECT_EQ(request(server_->port(), http::verb::get, "/nope").result(),
            http::status::not_found);
  EXPECT_EQ(request(server_->port(), http::verb::get, "/funnels/reload").result(),
            http::status::not_found);
}

TEST(ControlServer, BadHostThrows) {
  net::io_context ioc;
  EXPECT_THROW(ControlServer(ioc, "not-an-ip", 0, [] { return json{}; },
                             [] { return std::size_t{0}; }),
               std::runtime_error);
}
