#include <relay/relay-server.hxx>

#include <cassert>
#include <string>
#include <exception>

#include <relay/relay-log.hxx>

using namespace std;
using namespace relay;

static void
rethrow (exception_ptr e)
{
  if (e)
    rethrow_exception (e);
}

// Requests the server answers by itself or after a failed dispatch, all on
// one kept-alive connection.
//
static void
test_routes ()
{
  asio::io_context ioc;

  // Nobody listens on the upstream proxy port.
  //
  upstream_credential cred;
  {
    tcp::acceptor a (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"),
                                         0));
    cred = upstream_credential {"127.0.0.1",
                                to_string (a.local_endpoint ().port ()),
                                "u",
                                "p"};
  }

  http_client client (ioc, cred);

  server_options o;
  o.address = "127.0.0.1";
  o.port = 0;

  relay_server server (ioc, client, o);
  server.listen ();

  asio::co_spawn (ioc, server.run (), rethrow);

  struct exchange
  {
    const char* method;
    const char* target;
    unsigned    status;
    const char* body;
  };

  const exchange xs[] = {
    {"GET",      "/",             404, "Not Found"},
    {"GET",      "/proxy",        400, "Missing target URL"},
    {"POST",     "/proxy?url=x",  400, "Invalid target URL"},
    {"PROPFIND", "/proxy?url=x",  501, "Not Implemented"},
    {"GET",      "/proxy?url=http%3A%2F%2Fexample.com%2F", 500, "Proxy Error"}};

  size_t n (0);

  asio::co_spawn (
    ioc,
    [&] () -> asio::awaitable<void>
    {
      beast::tcp_stream s (ioc);
      co_await s.async_connect (server.local_endpoint (), asio::use_awaitable);

      beast::flat_buffer b;

      for (const exchange& x: xs)
      {
        http::request<http::string_body> req;
        req.method_string (x.method);
        req.target (x.target);
        req.version (11);
        req.set (http::field::host, "localhost");
        req.prepare_payload ();

        co_await http::async_write (s, req, asio::use_awaitable);

        http::response<http::string_body> res;
        co_await http::async_read (s, b, res, asio::use_awaitable);

        assert (res.result_int () == x.status);
        assert (res.body () == x.body);
        assert (res.keep_alive ());
        ++n;
      }

      server.stop ();
    },
    rethrow);

  ioc.run ();

  assert (n == sizeof (xs) / sizeof (xs[0]));
}

int
main ()
{
  verbosity = 0;

  test_routes ();
}
