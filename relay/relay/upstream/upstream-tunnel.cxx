#include <relay/upstream/upstream-tunnel.hxx>

#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace relay
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  http::request<http::empty_body>
  make_connect_request (const upstream_credential& c, const string& a)
  {
    http::request<http::empty_body> r (http::verb::connect, a, 11);

    r.set (http::field::host, a);
    r.set (http::field::proxy_authorization, c.authorization ());

    // Some proxies close the tunnel early without this.
    //
    r.set (http::field::proxy_connection, "keep-alive");

    return r;
  }

  asio::awaitable<void>
  connect_upstream (beast::tcp_stream& s, const upstream_credential& c)
  {
    string h (c.host);
    if (!h.empty () && h.front () == '[')
      h = h.substr (1, h.size () - 2);

    tcp::resolver r (s.get_executor ());
    auto eps (co_await r.async_resolve (h, c.port, asio::use_awaitable));

    co_await s.async_connect (eps, asio::use_awaitable);
  }

  asio::awaitable<void>
  open_tunnel (beast::tcp_stream& s,
               const upstream_credential& c,
               const string& a)
  {
    auto req (make_connect_request (c, a));
    co_await http::async_write (s, req, asio::use_awaitable);

    // The response to a successful CONNECT has no body no matter what its
    // headers say, so tell the parser not to expect one.
    //
    beast::flat_buffer b;
    http::response_parser<http::empty_body> p;
    p.skip (true);

    co_await http::async_read (s, b, p, asio::use_awaitable);

    unsigned int st (p.get ().result_int ());

    if (st / 100 != 2)
      throw upstream_failure ("upstream proxy refused tunnel to " + a + ": " +
                              std::to_string (st) + ' ' +
                              string (p.get ().reason ()));

    // Anything the proxy sent past the header would be the target talking
    // before we said anything, which no protocol we relay does.
    //
    if (b.size () != 0)
      throw upstream_failure ("unexpected data after tunnel response from " +
                              c.endpoint ());
  }
}
