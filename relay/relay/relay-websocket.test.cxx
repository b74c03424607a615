#include <relay/relay-websocket.hxx>

#include <cassert>
#include <string>
#include <exception>

#include <boost/asio/redirect_error.hpp>

#include <relay/relay-log.hxx>

using namespace std;
using namespace relay;

using ws_stream = websocket::stream<beast::tcp_stream>;

// The upstream proxy and the target in one: grant the tunnel and then speak
// WebSocket on it, echoing every frame back.
//
struct fake_target
{
  tcp::acceptor acceptor;

  bool close_first = false; // Close with 1001 after the first echo.
  bool drop_first = false;  // Drop the connection after the first echo.

  string connect;           // CONNECT request target.
  string target;            // Upgrade request target.
  string host;
  string origin;
  string protocol;
  websocket::close_reason closed;

  explicit
  fake_target (asio::io_context& ioc)
    : acceptor (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0))
  {
  }
};

static asio::awaitable<void>
run_target (fake_target& t)
{
  beast::tcp_stream s (co_await t.acceptor.async_accept (asio::use_awaitable));

  beast::flat_buffer b;
  http::request<http::empty_body> c;
  co_await http::async_read (s, b, c, asio::use_awaitable);

  t.connect = string (c.target ());

  string ok ("HTTP/1.1 200 Connection established\r\n\r\n");
  co_await asio::async_write (s, asio::buffer (ok), asio::use_awaitable);

  http::request<http::string_body> up;
  co_await http::async_read (s, b, up, asio::use_awaitable);

  t.target = string (up.target ());
  t.host = string (up[http::field::host]);
  t.origin = string (up[http::field::origin]);
  t.protocol = string (up[http::field::sec_websocket_protocol]);

  ws_stream ws (std::move (s));
  ws.set_option (websocket::stream_base::decorator (
    [] (websocket::response_type& r)
    {
      r.set (http::field::sec_websocket_protocol, "chat");
    }));

  co_await ws.async_accept (up, asio::use_awaitable);

  for (;;)
  {
    beast::flat_buffer m;
    beast::error_code ec;
    co_await ws.async_read (m, asio::redirect_error (asio::use_awaitable, ec));

    if (ec)
    {
      if (ec == websocket::error::closed)
        t.closed = ws.reason ();

      break;
    }

    string e ("echo: " + beast::buffers_to_string (m.data ()));
    ws.text (ws.got_text ());
    co_await ws.async_write (asio::buffer (e), asio::use_awaitable);

    if (t.close_first)
    {
      co_await ws.async_close (websocket::close_code::going_away,
                               asio::use_awaitable);
      break;
    }

    // No closing handshake, just the TCP connection going away.
    //
    if (t.drop_first)
    {
      beast::get_lowest_layer (ws).close ();
      break;
    }
  }
}

// The relay's side: accept one connection, read the upgrade, and serve it.
//
static asio::awaitable<void>
run_relay (tcp::acceptor& a, websocket_relay& r, bool& done)
{
  beast::tcp_stream s (co_await a.async_accept (asio::use_awaitable));

  beast::flat_buffer b;
  http::request<http::string_body> up;
  co_await http::async_read (s, b, up, asio::use_awaitable);

  assert (websocket::is_upgrade (up));

  co_await r.serve (std::move (s), std::move (up));
  done = true;
}

static void
rethrow (exception_ptr e)
{
  if (e)
    rethrow_exception (e);
}

// Everything one test needs: the fake target, the relay, and a place for the
// client to connect to.
//
struct harness
{
  asio::io_context ioc;
  fake_target target;
  tcp::acceptor inbound;
  upstream_credential cred;
  http_session session;
  websocket_relay relay;
  bool done = false;

  // If reachable is false, point the credential at a port nobody listens on.
  //
  explicit
  harness (bool reachable = true)
    : target (ioc),
      inbound (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0)),
      cred {"127.0.0.1",
            to_string (target.acceptor.local_endpoint ().port ()),
            "u",
            "p"},
      session (ioc, cred, http_client_traits<> ()),
      relay (session)
  {
    if (!reachable)
      target.acceptor.close ();
  }

  tcp::endpoint
  endpoint () const
  {
    return inbound.local_endpoint ();
  }
};

static void
test_target ()
{
  assert (websocket_target ("http://example.com/a") == "ws://example.com/a");
  assert (websocket_target ("https://example.com:8443/a?b") ==
          "wss://example.com:8443/a?b");
  assert (websocket_target ("wss://example.com/") == "wss://example.com/");
}

// Frames flow both ways with their kind, and a client close reaches the
// target with its code.
//
static void
test_relay ()
{
  harness h;

  asio::co_spawn (h.ioc, run_target (h.target), rethrow);
  asio::co_spawn (h.ioc, run_relay (h.inbound, h.relay, h.done), rethrow);

  string protocol;
  string text;
  string binary;
  bool binary_kind (true);

  asio::co_spawn (
    h.ioc,
    [&] () -> asio::awaitable<void>
    {
      ws_stream ws (h.ioc);
      co_await beast::get_lowest_layer (ws).async_connect (h.endpoint (),
                                                           asio::use_awaitable);

      ws.set_option (websocket::stream_base::decorator (
        [] (websocket::request_type& r)
        {
          r.set (http::field::origin, "http://localhost:3000");
          r.set (http::field::sec_websocket_protocol, "chat");
        }));

      websocket::response_type res;
      co_await ws.async_handshake (
        res,
        "localhost",
        "/proxy?url=http%3A%2F%2Fexample.com%2Fchat%3Froom%3D1",
        asio::use_awaitable);

      protocol = string (res[http::field::sec_websocket_protocol]);

      beast::flat_buffer b;

      ws.text (true);
      co_await ws.async_write (asio::buffer (string ("ping")),
                               asio::use_awaitable);
      co_await ws.async_read (b, asio::use_awaitable);
      assert (ws.got_text ());
      text = beast::buffers_to_string (b.data ());
      b.consume (b.size ());

      ws.binary (true);
      co_await ws.async_write (asio::buffer (string ("\x01\x02", 2)),
                               asio::use_awaitable);
      co_await ws.async_read (b, asio::use_awaitable);
      binary_kind = ws.got_binary ();
      binary = beast::buffers_to_string (b.data ());

      co_await ws.async_close (websocket::close_reason (4000, "bye"),
                               asio::use_awaitable);
    },
    rethrow);

  h.ioc.run ();

  assert (h.done);

  assert (h.target.connect == "example.com:80");
  assert (h.target.target == "/chat?room=1");
  assert (h.target.host == "example.com");
  assert (h.target.origin == "http://localhost:3000");
  assert (h.target.protocol == "chat");

  assert (protocol == "chat");
  assert (text == "echo: ping");
  assert (binary == string ("echo: \x01\x02", 8));
  assert (binary_kind);

  assert (h.target.closed.code == 4000);
}

// The target closing first takes the client down with the same code.
//
static void
test_target_close ()
{
  harness h;
  h.target.close_first = true;

  asio::co_spawn (h.ioc, run_target (h.target), rethrow);
  asio::co_spawn (h.ioc, run_relay (h.inbound, h.relay, h.done), rethrow);

  string echo;
  websocket::close_reason closed;

  asio::co_spawn (
    h.ioc,
    [&] () -> asio::awaitable<void>
    {
      ws_stream ws (h.ioc);
      co_await beast::get_lowest_layer (ws).async_connect (h.endpoint (),
                                                           asio::use_awaitable);

      co_await ws.async_handshake (
        "localhost",
        "/proxy?url=ws%3A%2F%2Fexample.com%3A8080%2F",
        asio::use_awaitable);

      beast::flat_buffer b;
      co_await ws.async_write (asio::buffer (string ("hi")),
                               asio::use_awaitable);
      co_await ws.async_read (b, asio::use_awaitable);
      echo = beast::buffers_to_string (b.data ());

      beast::error_code ec;
      co_await ws.async_read (b, asio::redirect_error (asio::use_awaitable, ec));
      assert (ec == websocket::error::closed);
      closed = ws.reason ();
    },
    rethrow);

  h.ioc.run ();

  assert (h.done);
  assert (h.target.connect == "example.com:8080");
  assert (h.target.host == "example.com:8080");
  assert (echo == "echo: hi");
  assert (closed.code == websocket::close_code::going_away);
}

// The target dropping the connection is an error, which the client sees as
// 1011.
//
static void
test_target_drop ()
{
  harness h;
  h.target.drop_first = true;

  asio::co_spawn (h.ioc, run_target (h.target), rethrow);
  asio::co_spawn (h.ioc, run_relay (h.inbound, h.relay, h.done), rethrow);

  string echo;
  websocket::close_reason closed;

  asio::co_spawn (
    h.ioc,
    [&] () -> asio::awaitable<void>
    {
      ws_stream ws (h.ioc);
      co_await beast::get_lowest_layer (ws).async_connect (h.endpoint (),
                                                           asio::use_awaitable);

      co_await ws.async_handshake ("localhost",
                                   "/proxy?url=ws%3A%2F%2Fexample.com%2F",
                                   asio::use_awaitable);

      beast::flat_buffer b;
      co_await ws.async_write (asio::buffer (string ("hi")),
                               asio::use_awaitable);
      co_await ws.async_read (b, asio::use_awaitable);
      echo = beast::buffers_to_string (b.data ());

      beast::error_code ec;
      co_await ws.async_read (b, asio::redirect_error (asio::use_awaitable, ec));
      assert (ec == websocket::error::closed);
      closed = ws.reason ();
    },
    rethrow);

  h.ioc.run ();

  assert (h.done);
  assert (echo == "echo: hi");
  assert (closed.code == websocket::close_code::internal_error);
}

// Likewise, the client dropping the connection closes the target with 1011.
//
static void
test_client_drop ()
{
  harness h;

  asio::co_spawn (h.ioc, run_target (h.target), rethrow);
  asio::co_spawn (h.ioc, run_relay (h.inbound, h.relay, h.done), rethrow);

  string echo;

  asio::co_spawn (
    h.ioc,
    [&] () -> asio::awaitable<void>
    {
      ws_stream ws (h.ioc);
      co_await beast::get_lowest_layer (ws).async_connect (h.endpoint (),
                                                           asio::use_awaitable);

      co_await ws.async_handshake ("localhost",
                                   "/proxy?url=ws%3A%2F%2Fexample.com%2F",
                                   asio::use_awaitable);

      beast::flat_buffer b;
      co_await ws.async_write (asio::buffer (string ("hi")),
                               asio::use_awaitable);
      co_await ws.async_read (b, asio::use_awaitable);
      echo = beast::buffers_to_string (b.data ());

      beast::get_lowest_layer (ws).close ();
    },
    rethrow);

  h.ioc.run ();

  assert (h.done);
  assert (echo == "echo: hi");
  assert (h.target.closed.code == websocket::close_code::internal_error);
}

// Connect to the relay, upgrade to the target, and return the close reason
// the relay answers with right away.
//
static websocket::close_reason
rejected (harness& h, const string& target)
{
  asio::co_spawn (h.ioc, run_relay (h.inbound, h.relay, h.done), rethrow);

  websocket::close_reason r;

  asio::co_spawn (
    h.ioc,
    [&] () -> asio::awaitable<void>
    {
      ws_stream ws (h.ioc);
      co_await beast::get_lowest_layer (ws).async_connect (h.endpoint (),
                                                           asio::use_awaitable);

      co_await ws.async_handshake ("localhost", target, asio::use_awaitable);

      beast::flat_buffer b;
      beast::error_code ec;
      co_await ws.async_read (b, asio::redirect_error (asio::use_awaitable, ec));
      assert (ec == websocket::error::closed);
      r = ws.reason ();
    },
    rethrow);

  h.ioc.run ();

  assert (h.done);
  return r;
}

static void
test_rejected ()
{
  {
    harness h;
    assert (rejected (h, "/proxy").code == websocket::close_code::policy_error);
  }

  {
    harness h;
    assert (rejected (h, "/proxy?url=").code ==
            websocket::close_code::policy_error);
  }

  {
    harness h;
    assert (rejected (h, "/proxy?url=nowhere").code ==
            websocket::close_code::internal_error);
  }

  {
    harness h (false);
    assert (rejected (h, "/proxy?url=ws%3A%2F%2Fexample.com%2F").code ==
            websocket::close_code::internal_error);
  }
}

int
main ()
{
  verbosity = 0;

  test_target ();
  test_relay ();
  test_target_close ();
  test_target_drop ();
  test_client_drop ();
  test_rejected ();
}
