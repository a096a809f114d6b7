#pragma once
#include "config.hpp"
#include "target_router.hpp"
#include "types.hpp"

#include <chrono>
#include <string>
#include <unordered_map>

#include <boost/asio/ssl/context.hpp>

namespace trafficgen {

struct HitResult {
  bool ok{false};
  int status{0};
  double latency_ms{0};
  std::string target;
  std::string error;
};

// Отправка одного хита. Ошибки доставки не бросаются: возвращается ok=false.
class HitSender {
public:
  virtual ~HitSender() = default;
  virtual HitResult send(const Hit &hit) = 0;
};

struct Endpoint {
  bool tls{false};
  std::string host;
  std::string port;
  std::string path; // начинается с '/'
};

// http(s)://host[:port][/path]; бросает std::invalid_argument
Endpoint parse_endpoint(const std::string &url);

// RFC 3986: всё, кроме unreserved, в %XX
std::string url_encode(const std::string &s);

std::string build_query(const HitParams &params);

// Добавляет idsite цели в начало и token_auth в конец, если есть cdt или cip
HitParams finalize_params(const HitParams &params, const Target &target,
                          const std::string &default_token);

// HTTP GET через Boost.Beast, цель выбирает TargetRouter. Один запрос,
// одно соединение, без повторов; таймаут считается обычной ошибкой.
class HttpHitSender : public HitSender {
public:
  HttpHitSender(const Config &cfg, TargetRouter &router);

  HitResult send(const Hit &hit) override;

private:
  HitResult perform(const Endpoint &ep, const std::string &target,
                    const std::string &user_agent);

  const Config cfg_;
  TargetRouter &router_;
  std::chrono::milliseconds timeout_;
  std::unordered_map<std::string, Endpoint> endpoints_;
  boost::asio::ssl::context ssl_ctx_;
};

} // namespace trafficgen
