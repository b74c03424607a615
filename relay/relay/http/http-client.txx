#include <limits>
#include <optional>
#include <chrono>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace relay
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return http::verb::get;
      case http_method::head:    return http::verb::head;
      case http_method::post:    return http::verb::post;
      case http_method::put:     return http::verb::put;
      case http_method::delete_: return http::verb::delete_;
      case http_method::options: return http::verb::options;
      case http_method::trace:   return http::verb::trace;
      case http_method::patch:   return http::verb::patch;
    }
    return http::verb::get;
  }

  // Set the SNI (Server Name Indication) hostname.
  //
  // Beast doesn't wrap this (it's a lower-level TLS feature) so we drop down
  // to the OpenSSL API. IP literals don't get SNI.
  //
  template <typename Stream>
  inline void
  set_server_name (Stream& s, const url_parts& p)
  {
    if (p.ipv6 ())
      return;

    if (!SSL_set_tlsext_host_name (s.native_handle (), p.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI hostname");
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (const request_type& r)
  {
    url_parts parts (parse_url (r.url));

    request_type req (r.method,
                      r.url,
                      curate_headers (session_->traits ().default_headers,
                                      r.headers),
                      r.body);

    // Everything that can go wrong below is a transport problem from the
    // caller's point of view. Note that upstream_failure (tunnel refused)
    // passes through as is.
    //
    try
    {
      if (parts.secure ())
        co_return co_await request_ssl (req, parts);
      else
        co_return co_await request_tcp (req, parts);
    }
    catch (const boost::system::system_error& e)
    {
      throw upstream_failure (r.url + ": " + e.what ());
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_ssl (const request_type& req, const url_parts& parts)
  {
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());
    const auto& cred (session_->credential ());

    stream_type s (ctx, session_->ssl_context ());
    set_server_name (s, parts);

    if (tr.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (parts.bare_host ()));

    // Connect to the proxy, ask it for a tunnel, and then talk TLS to the
    // target through it. The connect timeout covers all three.
    //
    auto& layer (beast::get_lowest_layer (s));
    layer.expires_after (std::chrono::milliseconds (tr.connect_timeout));

    co_await connect_upstream (layer, cred);
    co_await open_tunnel (layer, cred, parts.host + ':' + parts.port);

    co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);

    response_type r (co_await exchange (s, req, parts, false));

    // Note that we don't attempt the TLS shutdown: lots of servers just drop
    // the connection after the response and waiting for their close_notify
    // would only block until timeout.
    //
    beast::error_code ec;
    layer.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_tcp (const request_type& req, const url_parts& parts)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    beast::tcp_stream s (ctx);
    s.expires_after (std::chrono::milliseconds (tr.connect_timeout));

    co_await connect_upstream (s, session_->credential ());

    response_type r (co_await exchange (s, req, parts, true));

    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s,
            const request_type& req,
            const url_parts& parts,
            bool proxied)
  {
    const auto& tr (session_->traits ());
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::string_body> br;
    br.method (to_beast_verb (req.method));
    br.version (11);

    // A plain request to a forward proxy carries the absolute URL as its
    // target and the proxy credential in the header.
    //
    if (proxied)
    {
      string_type u (req.url.substr (0, req.url.find ('#')));
      br.target (u);
    }
    else
      br.target (parts.target);

    for (const auto& h: req.headers)
      br.insert (h.name, h.value);

    br.set (http::field::host, parts.authority ());

    if (proxied)
      br.set (http::field::proxy_authorization,
              session_->credential ().authorization ());

    if (req.body)
      br.body () = *req.body;

    br.prepare_payload ();

    // Note that the deadline covers both the write and the complete read.
    //
    layer.expires_after (std::chrono::milliseconds (tr.request_timeout));
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the complete response. There is no body limit: we relay whatever
    // the target sends. A response to HEAD has no body regardless of what
    // Content-Length says.
    //
    // Interim responses (100 Continue, 103 Early Hints) may precede the final
    // one so skip them, each with a fresh parser over the same buffer.
    //
    beast::flat_buffer b;
    std::optional<http::response_parser<http::string_body>> p;

    for (;;)
    {
      p.emplace ();
      p->body_limit (std::numeric_limits<std::uint64_t>::max ());

      if (req.method == http_method::head)
        p->skip (true);

      co_await http::async_read (s, b, *p, asio::use_awaitable);

      unsigned int st (p->get ().result_int ());
      if (st / 100 != 1 || st == 101)
        break;
    }

    auto& res (p->get ());

    response_type r;
    r.status = static_cast<std::uint16_t> (res.result_int ());

    for (const auto& h: res)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    r.body = std::move (res.body ());

    co_return r;
  }
}
