#pragma once

#include <string>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <relay/http/http-client.hxx>
#include <relay/rewrite/rewrite-classifier.hxx>
#include <relay/relay-handler.hxx>
#include <relay/relay-websocket.hxx>

namespace relay
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;

  using relay_handler = basic_relay_handler<http_client>;

  struct server_options
  {
    std::string   address = "0.0.0.0";
    std::uint16_t port = 3000;

    rewrite_options rewrite;
  };

  // Inbound server.
  //
  // Every accepted connection is served by its own coroutine. Requests on a
  // connection are handled one after another for as long as the client keeps
  // it alive: /proxy goes to the relay handler, a WebSocket upgrade of
  // /proxy hands the connection over to the WebSocket relay, and anything
  // else is answered with 404.
  //
  class relay_server
  {
  public:
    relay_server (asio::io_context&, http_client&, const server_options&);

    relay_server (const relay_server&) = delete;
    relay_server& operator= (const relay_server&) = delete;

    // Bind and start listening. Throw boost::system::system_error if the
    // address can't be used.
    //
    void
    listen ();

    asio::ip::tcp::endpoint
    local_endpoint () const
    {
      return acceptor_.local_endpoint ();
    }

    // Accept connections until stopped.
    //
    asio::awaitable<void>
    run ();

    // Stop accepting. Connections being served are not interrupted.
    //
    void
    stop ();

  private:
    asio::awaitable<void>
    serve (beast::tcp_stream);

  private:
    asio::io_context& ioc_;
    server_options options_;
    asio::ip::tcp::acceptor acceptor_;
    relay_handler handler_;
    websocket_relay websocket_;
  };
}
