#include "trafficgen/hit_sender.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/metrics_export.hpp"
#include "trafficgen/time_utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace trafficgen {

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;

// Цепочка resolve -> connect -> [handshake] -> write -> read на локальном
// io_context; живёт, пока идёт run_for()
template <class Stream>
class GetExchange {
  static constexpr bool kTls = std::is_same<Stream, TlsStream>::value;

public:
  GetExchange(net::io_context &ioc, Stream &stream, const Endpoint &ep,
              http::request<http::empty_body> &req,
              std::chrono::milliseconds timeout)
      : resolver_(ioc), stream_(stream), ep_(ep), req_(req),
        timeout_(timeout) {}

  void start() {
    resolver_.async_resolve(
        ep_.host, ep_.port,
        [this](beast::error_code ec, tcp::resolver::results_type results) {
          on_resolve(ec, results);
        });
  }

  bool done() const noexcept { return done_; }
  const beast::error_code &error() const noexcept { return ec_; }
  unsigned status() const noexcept { return status_; }

private:
  auto &lowest() { return beast::get_lowest_layer(stream_); }

  void fail(beast::error_code ec) {
    ec_ = ec;
    done_ = true;
  }

  void on_resolve(beast::error_code ec,
                  const tcp::resolver::results_type &results) {
    if (ec)
      return fail(ec);
    lowest().expires_after(timeout_);
    lowest().async_connect(results,
                           [this](beast::error_code ec, tcp::endpoint) {
                             on_connect(ec);
                           });
  }

  void on_connect(beast::error_code ec) {
    if (ec)
      return fail(ec);
    if constexpr (kTls) {
      lowest().expires_after(timeout_);
      stream_.async_handshake(ssl::stream_base::client,
                              [this](beast::error_code ec) { on_ready(ec); });
    } else {
      on_ready({});
    }
  }

  void on_ready(beast::error_code ec) {
    if (ec)
      return fail(ec);
    lowest().expires_after(timeout_);
    http::async_write(stream_, req_,
                      [this](beast::error_code ec, std::size_t) {
                        on_write(ec);
                      });
  }

  void on_write(beast::error_code ec) {
    if (ec)
      return fail(ec);
    http::async_read(stream_, buffer_, res_,
                     [this](beast::error_code ec, std::size_t) {
                       on_read(ec);
                     });
  }

  void on_read(beast::error_code ec) {
    if (ec)
      return fail(ec);
    status_ = res_.result_int();
    done_ = true;
    beast::error_code ignored;
    lowest().socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  tcp::resolver resolver_;
  Stream &stream_;
  const Endpoint &ep_;
  http::request<http::empty_body> &req_;
  std::chrono::milliseconds timeout_;
  beast::flat_buffer buffer_;
  http::response<http::string_body> res_;
  beast::error_code ec_;
  unsigned status_{0};
  bool done_{false};
};

template <class Stream>
HitResult run_exchange(net::io_context &ioc, Stream &stream,
                       const Endpoint &ep,
                       http::request<http::empty_body> &req,
                       std::chrono::milliseconds timeout) {
  HitResult r;
  GetExchange<Stream> ex(ioc, stream, ep, req, timeout);
  ex.start();
  // resolve не покрыт expires_after, поэтому общий предел на весь обмен
  ioc.run_for(timeout * 2);
  if (!ex.done()) {
    ioc.stop();
    r.error = "timeout";
    return r;
  }
  if (ex.error()) {
    r.error = ex.error().message();
    return r;
  }
  r.status = static_cast<int>(ex.status());
  r.ok = r.status >= 200 && r.status < 300;
  if (!r.ok)
    r.error = "HTTP " + std::to_string(r.status);
  return r;
}

bool has_param(const HitParams &params, const char *key) {
  return std::any_of(params.begin(), params.end(),
                     [key](const auto &kv) { return kv.first == key; });
}

} // namespace

Endpoint parse_endpoint(const std::string &url) {
  Endpoint ep;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    ep.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("endpoint must start with http:// or https://: " +
                                url);
  }
  const auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  ep.path = slash == std::string::npos ? "/" : rest.substr(slash);
  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    ep.host = authority.substr(0, colon);
    ep.port = authority.substr(colon + 1);
  } else {
    ep.host = authority;
    ep.port = ep.tls ? "443" : "80";
  }
  if (ep.host.empty() || ep.port.empty())
    throw std::invalid_argument("endpoint has no host: " + url);
  return ep;
}

std::string url_encode(const std::string &s) {
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string build_query(const HitParams &params) {
  std::string q;
  for (const auto &kv : params) {
    if (!q.empty())
      q.push_back('&');
    q += url_encode(kv.first);
    q.push_back('=');
    q += url_encode(kv.second);
  }
  return q;
}

HitParams finalize_params(const HitParams &params, const Target &target,
                          const std::string &default_token) {
  HitParams out;
  out.reserve(params.size() + 2);
  out.emplace_back("idsite", std::to_string(target.site_id));
  out.insert(out.end(), params.begin(), params.end());
  const std::string token = target.token_auth ? *target.token_auth : default_token;
  if (!token.empty() && (has_param(params, "cdt") || has_param(params, "cip")))
    out.emplace_back("token_auth", token);
  return out;
}

HttpHitSender::HttpHitSender(const Config &cfg, TargetRouter &router)
    : cfg_(cfg), router_(router),
      timeout_(seconds_to_ms(cfg.request_timeout_seconds)),
      ssl_ctx_(ssl::context::tls_client) {
  for (const auto &t : router_.enabled_targets())
    endpoints_.emplace(t.name, parse_endpoint(t.url));
  ssl_ctx_.set_options(ssl::context::default_workarounds |
                       ssl::context::no_sslv2);
  // трекеры в стендах часто с самоподписанными сертификатами
  ssl_ctx_.set_verify_mode(ssl::verify_none);
}

HitResult HttpHitSender::send(const Hit &hit) {
  const Target &target = router_.next_target();
  const HitParams params = finalize_params(hit.params, target, cfg_.token_auth);
  const Endpoint &ep = endpoints_.at(target.name);
  const std::string request_target = ep.path + "?" + build_query(params);

  if (log_enabled(LogLevel::Debug))
    log_dbg("HIT", (ep.tls ? "https://" : "http://") + ep.host + ":" +
                       ep.port + request_target);

  const auto t0 = std::chrono::steady_clock::now();
  HitResult r;
  try {
    r = perform(ep, request_target, hit.user_agent);
  } catch (const std::exception &e) {
    r.ok = false;
    r.error = e.what();
  }
  r.latency_ms = std::chrono::duration<double, std::milli>(
                     std::chrono::steady_clock::now() - t0)
                     .count();
  r.target = target.name;

  if (r.ok) {
    router_.record_success(target.name, r.latency_ms);
    g_hits_sent.fetch_add(1ULL, std::memory_order_relaxed);
  } else {
    router_.record_failure(target.name, r.error);
    g_hits_failed.fetch_add(1ULL, std::memory_order_relaxed);
    log_dbg("HIT", "delivery to " + target.name + " failed: " + r.error);
  }
  return r;
}

HitResult HttpHitSender::perform(const Endpoint &ep, const std::string &target,
                                 const std::string &user_agent) {
  net::io_context ioc;

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, ep.host);
  req.set(http::field::user_agent,
          user_agent.empty() ? BOOST_BEAST_VERSION_STRING : user_agent);
  req.keep_alive(false);

  if (ep.tls) {
    TlsStream stream(ioc, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
      HitResult r;
      r.error = "SNI setup failed";
      return r;
    }
    return run_exchange(ioc, stream, ep, req, timeout_);
  }
  beast::tcp_stream stream(ioc);
  return run_exchange(ioc, stream, ep, req, timeout_);
}

} // namespace trafficgen
