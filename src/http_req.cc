#include "tnsw/http_req.h"

#include <exception>
#include <optional>
#include <sstream>

#include "boost/asio/awaitable.hpp"
#include "boost/asio/co_spawn.hpp"
#include "boost/asio/io_context.hpp"
#include "boost/asio/ssl.hpp"
#include "boost/beast/core.hpp"
#include "boost/beast/http.hpp"
#include "boost/beast/http/dynamic_body.hpp"
#include "boost/beast/ssl/ssl_stream.hpp"
#include "boost/beast/version.hpp"
#include "boost/iostreams/copy.hpp"
#include "boost/iostreams/device/array.hpp"
#include "boost/iostreams/filter/gzip.hpp"
#include "boost/iostreams/filtering_stream.hpp"
#include "boost/iostreams/filtering_streambuf.hpp"
#include "boost/url/url.hpp"

#include "tnsw/error.h"

namespace tnsw {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;

namespace {

using http_response = http::response<http::dynamic_body>;

#if !defined(TNSW_VERSION)
#define TNSW_VERSION "unknown"
#endif

constexpr auto const kUserAgent =
    "tnsw/" TNSW_VERSION " " BOOST_BEAST_VERSION_STRING;

constexpr auto const kMaxRedirects = 3U;

template <typename Stream>
asio::awaitable<http_response> req(Stream&&,
                                   boost::urls::url const&,
                                   headers_t const&);

asio::awaitable<http_response> req_no_tls(boost::urls::url const& url,
                                          headers_t const& headers,
                                          std::chrono::seconds const timeout) {
  auto executor = co_await asio::this_coro::executor;
  auto resolver = asio::ip::tcp::resolver{executor};
  auto stream = beast::tcp_stream{executor};

  auto const results = co_await resolver.async_resolve(
      url.host(), url.has_port() ? url.port() : "80");

  stream.expires_after(timeout);

  co_await stream.async_connect(results);
  co_return co_await req(std::move(stream), url, headers);
}

asio::awaitable<http_response> req_tls(boost::urls::url const& url,
                                       headers_t const& headers,
                                       std::chrono::seconds const timeout) {
  auto ssl_ctx = ssl::context{ssl::context::tlsv12_client};
  ssl_ctx.set_default_verify_paths();
  ssl_ctx.set_verify_mode(ssl::verify_peer);
  ssl_ctx.set_options(ssl::context::default_workarounds |
                      ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                      ssl::context::single_dh_use);

  auto executor = co_await asio::this_coro::executor;
  auto resolver = asio::ip::tcp::resolver{executor};
  auto stream = ssl::stream<beast::tcp_stream>{executor, ssl_ctx};

  auto const host = url.host();
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast)
  if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                const_cast<char*>(host.c_str()))) {
    throw boost::system::system_error{{static_cast<int>(::ERR_get_error()),
                                       boost::asio::error::get_ssl_category()}};
  }
  stream.set_verify_callback(ssl::host_name_verification{host});

  auto const results = co_await resolver.async_resolve(
      url.host(), url.has_port() ? url.port() : "443");

  stream.next_layer().expires_after(timeout);

  co_await beast::get_lowest_layer(stream).async_connect(results);
  co_await stream.async_handshake(ssl::stream_base::client);
  co_return co_await req(std::move(stream), url, headers);
}

template <typename Stream>
asio::awaitable<http_response> req(Stream&& stream,
                                   boost::urls::url const& url,
                                   headers_t const& headers) {
  auto req = http::request<http::string_body>{http::verb::get,
                                              url.encoded_target(), 11};
  req.set(http::field::host, url.host());
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::accept_encoding, "gzip");
  for (auto const& [k, v] : headers) {
    req.set(k, v);
  }

  co_await http::async_write(stream, req);

  auto p = http::response_parser<http::dynamic_body>{};
  p.eager(true);
  p.body_limit(kBodySizeLimit);

  auto buffer = beast::flat_buffer{};
  co_await http::async_read(stream, buffer, p);

  auto ec = beast::error_code{};
  beast::get_lowest_layer(stream).socket().shutdown(
      asio::ip::tcp::socket::shutdown_both, ec);
  co_return p.release();
}

asio::awaitable<http_response> http_GET(boost::urls::url url,
                                        headers_t const& headers,
                                        std::chrono::seconds const timeout) {
  auto n_redirects = 0U;
  auto next_url = url;
  while (n_redirects < kMaxRedirects) {
    auto const res =
        co_await (next_url.scheme_id() == boost::urls::scheme::https
                      ? req_tls(next_url, headers, timeout)
                      : req_no_tls(next_url, headers, timeout));
    auto const code = res.base().result_int();
    if (code >= 300 && code < 400) {
      auto resolved = boost::urls::url{};
      boost::urls::resolve(next_url, boost::urls::url{res.base()["Location"]},
                           resolved)
          .value();
      next_url = std::move(resolved);
      ++n_redirects;
      continue;
    } else {
      co_return res;
    }
  }
  throw upstream_error{0U, R"(too many redirects: "{}", latest="{}")",
                       std::string_view{url.buffer()},
                       std::string_view{next_url.buffer()}};
}

std::string get_http_body(http_response const& res) {
  auto body = beast::buffers_to_string(res.body().data());
  if (res[http::field::content_encoding] == "gzip") {
    auto const src = boost::iostreams::array_source{body.data(), body.size()};
    auto is = boost::iostreams::filtering_istream{};
    auto os = std::stringstream{};
    is.push(boost::iostreams::gzip_decompressor{});
    is.push(src);
    boost::iostreams::copy(is, os);
    body = os.str();
  }
  return body;
}

}  // namespace

http_result http_GET_sync(boost::urls::url const& url,
                          headers_t const& headers,
                          std::chrono::seconds const timeout) {
  auto result = std::optional<http_result>{};
  auto failure = std::exception_ptr{};

  auto ioc = asio::io_context{};
  asio::co_spawn(
      ioc,
      [&]() -> asio::awaitable<void> {
        auto const res = co_await http_GET(url, headers, timeout);
        result = http_result{.status_ = res.result_int(),
                             .body_ = get_http_body(res)};
      },
      [&](std::exception_ptr const& e) { failure = e; });
  ioc.run_for(timeout);

  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (upstream_error const&) {
      throw;
    } catch (std::exception const& e) {
      throw upstream_error{0U, "GET {} failed: {}",
                           std::string_view{url.buffer()}, e.what()};
    }
  }

  if (!result.has_value()) {
    ioc.stop();
    throw upstream_error{0U, "GET {} timed out after {}s",
                         std::string_view{url.buffer()}, timeout.count()};
  }

  return std::move(*result);
}

}  // namespace tnsw
