#pragma once

#include <string>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <relay/url/url.hxx>
#include <relay/http/http-client.hxx>

namespace relay
{
  namespace asio      = boost::asio;
  namespace beast     = boost::beast;
  namespace websocket = boost::beast::websocket;

  // Map the target URL to its WebSocket equivalent (http to ws, https to
  // wss). Throw invalid_url if it is not an absolute relayable URL.
  //
  std::string
  websocket_target (const std::string& url);

  // Relay frames between two open WebSocket streams until either side
  // closes or fails.
  //
  // Each frame read on one side is written to the other with the same kind
  // (text or binary). A close received on one side is passed on to the other
  // with the same code, an error on either side closes the other with 1011.
  // Once both directions are done the underlying connections are closed.
  //
  template <typename A, typename B>
  asio::awaitable<void>
  relay_pair (A&, B&);

  // WebSocket relay.
  //
  // Serves an upgrade request for /proxy?url=<target> by opening a WebSocket
  // to the target through the upstream proxy (CONNECT tunnel, TLS on top for
  // wss) and then relaying frames between the two. The negotiation headers
  // of the upgrade (origin, subprotocol, user agent, cookies, language) are
  // passed on and the subprotocol selected by the target is passed back.
  //
  // If there is no target the inbound socket is accepted and closed with
  // 1008 (policy violation). An invalid target or failure to reach it closes
  // it with 1011 (internal error).
  //
  template <typename T = http_client_traits<>>
  class basic_websocket_relay
  {
  public:
    using traits_type  = T;
    using session_type = basic_http_session<traits_type>;
    using inbound_type = websocket::stream<beast::tcp_stream>;
    using request_type = beast::http::request<beast::http::string_body>;

    explicit
    basic_websocket_relay (session_type& s)
      : session_ (s) {}

    // Take over the connection the upgrade request was read from. Return
    // when the relay is over. Only throws on the server's own failures.
    //
    asio::awaitable<void>
    serve (beast::tcp_stream, request_type upgrade);

  private:
    // Open the outbound WebSocket and return the subprotocol the target
    // selected (empty if none).
    //
    template <typename Out>
    asio::awaitable<std::string>
    connect (Out&, const url_parts&, const request_type& upgrade);

    template <typename Out>
    asio::awaitable<void>
    relay (inbound_type&, const request_type&, Out&, const url_parts&);

    asio::awaitable<void>
    reject (inbound_type&,
            const request_type&,
            websocket::close_code,
            const char* reason);

  private:
    session_type& session_;
  };

  using websocket_relay = basic_websocket_relay<>;
}

#include <relay/relay-websocket.txx>
