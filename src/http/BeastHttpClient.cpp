#include "http/BeastHttpClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "http/Url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <utility>

namespace ddns::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kDefaultBodyLimit = 1024 * 1024;
constexpr const char* kUserAgent = "ddns-sync/1.0";

/// Runs the io_context until the operation started by fnStart completes.
/// Deadlines come from the tcp_stream expiry set before the call.
template <typename StartOp>
beast::error_code runOp(net::io_context& ioc, StartOp&& fnStart) {
  beast::error_code ec;
  fnStart([&ec](beast::error_code ecDone, auto&&...) { ec = ecDone; });
  ioc.restart();
  ioc.run();
  return ec;
}

[[noreturn]] void throwTransport(const std::string& sStep, const Url& url,
                                 const beast::error_code& ec) {
  if (ec == beast::error::timeout) {
    throw common::TransportError("http_timeout",
                                 sStep + " to " + url.sHost + " timed out");
  }
  if (ec == bhttp::error::body_limit) {
    throw common::ProviderError("response_too_large",
                                "Response from " + url.sHost + " exceeds the body limit");
  }
  throw common::TransportError("http_" + sStep + "_failed",
                               sStep + " to " + url.sHost + " failed: " + ec.message());
}

bhttp::verb toVerb(const std::string& sMethod) {
  const auto verb = bhttp::string_to_verb(sMethod);
  if (verb == bhttp::verb::unknown) {
    throw common::ValidationError("invalid_method", "Unsupported HTTP method: " + sMethod);
  }
  return verb;
}

/// Write the request and read the response over an already connected stream.
template <typename Stream>
HttpResponse exchange(net::io_context& ioc, Stream& stream, beast::tcp_stream& tcpStream,
                      const bhttp::request<bhttp::string_body>& req, const Url& url,
                      std::size_t uBodyLimit, std::chrono::seconds durTimeout) {
  tcpStream.expires_after(durTimeout);
  auto ec = runOp(ioc, [&](auto&& fnHandler) {
    bhttp::async_write(stream, req, std::forward<decltype(fnHandler)>(fnHandler));
  });
  if (ec) {
    throwTransport("write", url, ec);
  }

  beast::flat_buffer fbBuffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(uBodyLimit);

  tcpStream.expires_after(durTimeout);
  ec = runOp(ioc, [&](auto&& fnHandler) {
    bhttp::async_read(stream, fbBuffer, parser, std::forward<decltype(fnHandler)>(fnHandler));
  });
  if (ec) {
    throwTransport("read", url, ec);
  }

  auto res = parser.release();
  HttpResponse hres;
  hres.iStatus = static_cast<int>(res.result_int());
  const auto svReason = res.reason();
  hres.sReason.assign(svReason.data(), svReason.size());
  hres.sBody = std::move(res.body());
  return hres;
}

}  // namespace

BeastHttpClient::BeastHttpClient(std::chrono::seconds durTimeout) : _durTimeout(durTimeout) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::send(const HttpRequest& hreqRequest) {
  const Url url = Url::parse(hreqRequest.sUrl);
  const std::size_t uBodyLimit =
      hreqRequest.uMaxBodyBytes > 0 ? hreqRequest.uMaxBodyBytes : kDefaultBodyLimit;

  bhttp::request<bhttp::string_body> req{toVerb(hreqRequest.sMethod), url.sTarget, 11};
  req.set(bhttp::field::host, url.sHost);
  req.set(bhttp::field::user_agent, kUserAgent);
  for (const auto& [sName, sValue] : hreqRequest.vHeaders) {
    req.set(sName, sValue);
  }
  if (!hreqRequest.sBody.empty()) {
    req.body() = hreqRequest.sBody;
  }
  req.prepare_payload();

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::error_code ec;
  std::string sResolveHost = url.sHost;
  if (sResolveHost.size() > 2 && sResolveHost.front() == '[' && sResolveHost.back() == ']') {
    sResolveHost = sResolveHost.substr(1, sResolveHost.size() - 2);
  }
  const auto results = resolver.resolve(sResolveHost, url.sPort, ec);
  if (ec) {
    throwTransport("resolve", url, ec);
  }

  auto spLog = common::Logger::get();
  spLog->trace("HTTP {} {}://{}{}", hreqRequest.sMethod, url.sScheme, url.sHost, url.sTarget);

  if (url.sScheme == "http") {
    beast::tcp_stream stream(ioc);
    stream.expires_after(_durTimeout);
    ec = runOp(ioc, [&](auto&& fnHandler) {
      stream.async_connect(results, std::forward<decltype(fnHandler)>(fnHandler));
    });
    if (ec) {
      throwTransport("connect", url, ec);
    }

    auto hres = exchange(ioc, stream, stream, req, url, uBodyLimit, _durTimeout);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      spLog->debug("HTTP shutdown from {}: {}", url.sHost, ec.message());
    }
    return hres;
  }

  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.sHost.c_str())) {
    beast::error_code ecSni{static_cast<int>(::ERR_get_error()),
                            net::error::get_ssl_category()};
    throwTransport("sni", url, ecSni);
  }
  stream.set_verify_callback(ssl::host_name_verification(url.sHost));

  auto& tcpStream = beast::get_lowest_layer(stream);
  tcpStream.expires_after(_durTimeout);
  ec = runOp(ioc, [&](auto&& fnHandler) {
    tcpStream.async_connect(results, std::forward<decltype(fnHandler)>(fnHandler));
  });
  if (ec) {
    throwTransport("connect", url, ec);
  }

  tcpStream.expires_after(_durTimeout);
  ec = runOp(ioc, [&](auto&& fnHandler) {
    stream.async_handshake(ssl::stream_base::client,
                           std::forward<decltype(fnHandler)>(fnHandler));
  });
  if (ec) {
    throwTransport("handshake", url, ec);
  }

  auto hres = exchange(ioc, stream, tcpStream, req, url, uBodyLimit, _durTimeout);

  // Servers commonly close without close_notify; the response is already read.
  tcpStream.expires_after(_durTimeout);
  ec = runOp(ioc, [&](auto&& fnHandler) {
    stream.async_shutdown(std::forward<decltype(fnHandler)>(fnHandler));
  });
  if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
    spLog->debug("TLS shutdown from {}: {}", url.sHost, ec.message());
  }
  return hres;
}

}  // namespace ddns::http
