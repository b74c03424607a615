#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <relay/url/url.hxx>
#include <relay/http/http-types.hxx>
#include <relay/http/http-request.hxx>
#include <relay/http/http-response.hxx>
#include <relay/upstream/upstream-credential.hxx>
#include <relay/upstream/upstream-tunnel.hxx>

namespace relay
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // Return the browser-like header set every relayed request starts from.
  //
  http_headers
  browser_headers ();

  // Overlay the client's headers on top of the defaults.
  //
  // The host, origin, and referer headers are dropped so that the target
  // doesn't see the relay's own identity. Hop-by-hop and framing headers are
  // dropped as well since the outbound connection is framed independently.
  // Client values take precedence over the defaults, except that
  // Accept-Encoding is narrowed to the codings we can decode (gzip, deflate,
  // identity).
  //
  http_headers
  curate_headers (const http_headers& defaults, const http_headers& inbound);

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;
    using headers_type  = basic_http_headers<string_type>;

    // Connection timeout in milliseconds. Covers connecting to the upstream
    // proxy, the tunnel setup, and the TLS handshake.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds. Covers sending the request and
    // receiving the complete response.
    //
    std::uint32_t request_timeout = 30000;

    // Whether to verify target certificates.
    //
    bool verify_ssl = false;

    // CA certificate file (empty = system defaults).
    //
    string_type ssl_cert_file;

    headers_type default_headers = browser_headers ();
  };

  // State shared by every outbound connection: the event loop, the options,
  // the TLS context, and the upstream proxy credential. Read-only once
  // constructed.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc,
                        const upstream_credential& cred,
                        const traits_type& traits)
      : ioc_ (ioc),
        cred_ (cred),
        traits_ (traits),
        ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const upstream_credential&
    credential () const noexcept
    {
      return cred_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    const upstream_credential& cred_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // Upstream dispatcher.
  //
  // Sends a request to its target through the upstream proxy and returns the
  // response as is. Redirects are never followed: a 3xx response is handed
  // back to the caller. Any transport failure or timeout is reported as
  // upstream_failure.
  //
  // Plain http targets are sent to the proxy in the absolute form while
  // https targets go through a CONNECT tunnel with TLS on top.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    basic_http_client (asio::io_context& ioc, const upstream_credential& cred)
      : session_ (std::make_unique<session_type> (ioc, cred, traits_type ())) {}

    basic_http_client (asio::io_context& ioc,
                       const upstream_credential& cred,
                       const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, cred, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Relay the request. The url must be an absolute target URL and the
    // headers are the client's (they are curated here).
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_ssl (const request_type&, const url_parts&);

    asio::awaitable<response_type>
    request_tcp (const request_type&, const url_parts&);

    // Write the request and read the response on an established stream.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream&, const request_type&, const url_parts&, bool proxied);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <relay/http/http-client.ixx>
#include <relay/http/http-client.txx>
