#include <chrono>
#include <vector>
#include <utility>
#include <optional>
#include <type_traits>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>

#include <relay/relay-log.hxx>
#include <relay/upstream/upstream-tunnel.hxx>

namespace relay
{
  // Once open, a relayed WebSocket only times out closing. There is no idle
  // timeout: a quiet socket is kept for as long as both ends keep it.
  //
  inline websocket::stream_base::timeout
  relay_timeouts ()
  {
    websocket::stream_base::timeout t;
    t.handshake_timeout = std::chrono::seconds (30);
    t.idle_timeout = websocket::stream_base::none ();
    t.keep_alive_pings = false;
    return t;
  }

  // Close the WebSocket unless it is already closed. Errors are ignored: the
  // connection is going away either way.
  //
  template <typename S>
  asio::awaitable<void>
  close_websocket (S& s, websocket::close_reason r)
  {
    if (!s.is_open ())
      co_return;

    // A close without a code is passed on as a normal one.
    //
    if (r.code == websocket::close_code::none)
      r.code = websocket::close_code::normal;

    beast::error_code ec;
    co_await s.async_close (r, asio::redirect_error (asio::use_awaitable, ec));
  }

  // One direction of the relay.
  //
  template <typename From, typename To>
  asio::awaitable<void>
  forward_frames (From& from, To& to)
  {
    beast::flat_buffer b;
    beast::error_code ec;

    for (;;)
    {
      co_await from.async_read (b,
                                asio::redirect_error (asio::use_awaitable, ec));
      if (ec)
        break;

      if (to.is_open ())
      {
        to.text (from.got_text ());
        co_await to.async_write (b.data (),
                                 asio::redirect_error (asio::use_awaitable, ec));
        if (ec)
          break;
      }

      b.consume (b.size ());
    }

    // Cancelled because the other direction is done.
    //
    if (ec == asio::error::operation_aborted)
      co_return;

    if (ec == websocket::error::closed)
    {
      co_await close_websocket (to, from.reason ());
      co_return;
    }

    log_trace () << "websocket relay: " << ec.message ();

    websocket::close_reason r (websocket::close_code::internal_error);
    co_await close_websocket (to, r);
    co_await close_websocket (from, r);
  }

  template <typename A, typename B>
  asio::awaitable<void>
  relay_pair (A& a, B& b)
  {
    using namespace asio::experimental::awaitable_operators;

    co_await (forward_frames (a, b) || forward_frames (b, a));

    // Whatever state the streams are in, the connections are done.
    //
    beast::get_lowest_layer (a).close ();
    beast::get_lowest_layer (b).close ();
  }

  template <typename T>
  asio::awaitable<void> basic_websocket_relay<T>::
  serve (beast::tcp_stream s, request_type up)
  {
    std::string t (up.target ());

    log_trace () << "websocket " << t << ": upgrade";

    // The WebSocket stream keeps time from here on.
    //
    s.expires_never ();

    inbound_type in (std::move (s));
    in.set_option (relay_timeouts ());

    query_params ps (parse_query (target_query (t)));
    std::optional<std::string> raw (find_param (ps, "url"));

    if (!raw || raw->empty ())
    {
      log_trace () << "websocket " << t << ": no target URL";

      co_await reject (in,
                       up,
                       websocket::close_code::policy_error,
                       "Missing target URL");
      co_return;
    }

    // Same as for plain requests, the rest of the query goes to the target.
    //
    query_params rest;
    for (auto& p: ps)
    {
      if (p.first != "url")
        rest.push_back (std::move (p));
    }

    std::string target;
    url_parts parts;

    try
    {
      target = append_query (websocket_target (normalize (*raw)), rest);
      parts = parse_url (target);
    }
    catch (const invalid_url& e)
    {
      log_trace () << "websocket " << t << ": " << e.what ();
      target.clear ();
    }

    if (target.empty ())
    {
      co_await reject (in,
                       up,
                       websocket::close_code::internal_error,
                       "Invalid target URL");
      co_return;
    }

    log_info () << "relaying websocket " << target;

    if (parts.secure ())
    {
      websocket::stream<beast::ssl_stream<beast::tcp_stream>> out (
        session_.io_context (), session_.ssl_context ());

      co_await relay (in, up, out, parts);
    }
    else
    {
      websocket::stream<beast::tcp_stream> out (session_.io_context ());

      co_await relay (in, up, out, parts);
    }

    log_trace () << "websocket " << target << ": closed";
  }

  template <typename T>
  template <typename Out>
  asio::awaitable<std::string> basic_websocket_relay<T>::
  connect (Out& ws, const url_parts& p, const request_type& up)
  {
    namespace http = beast::http;

    const auto& tr (session_.traits ());
    const upstream_credential& cred (session_.credential ());

    // The connect timeout covers everything up to and including the
    // WebSocket handshake.
    //
    auto& layer (beast::get_lowest_layer (ws));
    layer.expires_after (std::chrono::milliseconds (tr.connect_timeout));

    co_await connect_upstream (layer, cred);
    co_await open_tunnel (layer, cred, p.host + ':' + p.port);

    if constexpr (!std::is_same_v<typename Out::next_layer_type,
                                  beast::tcp_stream>)
    {
      auto& tls (ws.next_layer ());
      set_server_name (tls, p);

      if (tr.verify_ssl)
        tls.set_verify_callback (ssl::host_name_verification (p.bare_host ()));

      co_await tls.async_handshake (ssl::stream_base::client,
                                    asio::use_awaitable);
    }

    // Pass on the negotiation headers, replacing whatever the stream would
    // have sent by itself.
    //
    std::vector<std::pair<http::field, std::string>> hs;

    for (http::field f: {http::field::origin,
                         http::field::sec_websocket_protocol,
                         http::field::user_agent,
                         http::field::cookie,
                         http::field::accept_language})
    {
      for (auto r (up.equal_range (f)); r.first != r.second; ++r.first)
        hs.emplace_back (f, std::string (r.first->value ()));
    }

    ws.set_option (websocket::stream_base::decorator (
      [hs] (websocket::request_type& r)
      {
        for (const auto& h: hs)
          r.erase (h.first);

        for (const auto& h: hs)
          r.insert (h.first, h.second);
      }));

    websocket::response_type res;
    co_await ws.async_handshake (res,
                                 p.authority (),
                                 p.target,
                                 asio::use_awaitable);

    layer.expires_never ();
    ws.set_option (relay_timeouts ());

    co_return std::string (res[http::field::sec_websocket_protocol]);
  }

  template <typename T>
  template <typename Out>
  asio::awaitable<void> basic_websocket_relay<T>::
  relay (inbound_type& in,
         const request_type& up,
         Out& out,
         const url_parts& p)
  {
    std::string protocol;
    bool connected (false);

    try
    {
      protocol = co_await connect (out, p, up);
      connected = true;
    }
    catch (const upstream_failure& e)
    {
      log_error () << e.what ();
    }
    catch (const boost::system::system_error& e)
    {
      log_error () << p.scheme << "://" << p.authority () << p.target << ": "
                   << e.what ();
    }

    if (!connected)
    {
      beast::get_lowest_layer (out).close ();

      co_await reject (in,
                       up,
                       websocket::close_code::internal_error,
                       "Upstream connection failed");
      co_return;
    }

    in.set_option (websocket::stream_base::decorator (
      [protocol] (websocket::response_type& r)
      {
        if (!protocol.empty ())
          r.set (beast::http::field::sec_websocket_protocol, protocol);
      }));

    beast::error_code ec;
    co_await in.async_accept (up,
                              asio::redirect_error (asio::use_awaitable, ec));

    if (ec)
    {
      log_trace () << "websocket " << p.target << ": " << ec.message ();

      co_await close_websocket (
        out, websocket::close_reason (websocket::close_code::going_away));

      beast::get_lowest_layer (out).close ();
      beast::get_lowest_layer (in).close ();
      co_return;
    }

    log_trace () << "websocket " << p.target << ": relaying";

    co_await relay_pair (in, out);
  }

  template <typename T>
  asio::awaitable<void> basic_websocket_relay<T>::
  reject (inbound_type& in,
          const request_type& up,
          websocket::close_code c,
          const char* reason)
  {
    beast::error_code ec;
    co_await in.async_accept (up,
                              asio::redirect_error (asio::use_awaitable, ec));

    if (!ec)
      co_await close_websocket (in, websocket::close_reason (c, reason));

    beast::get_lowest_layer (in).close ();
  }
}
