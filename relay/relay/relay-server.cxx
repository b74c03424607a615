#include <relay/relay-server.hxx>

#include <limits>
#include <utility>
#include <optional>
#include <exception>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <relay/url/url.hxx>
#include <relay/relay-log.hxx>

using namespace std;

namespace relay
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  static optional<http_method>
  from_beast_verb (http::verb v)
  {
    switch (v)
    {
    case http::verb::get:     return http_method::get;
    case http::verb::head:    return http_method::head;
    case http::verb::post:    return http_method::post;
    case http::verb::put:     return http_method::put;
    case http::verb::delete_: return http_method::delete_;
    case http::verb::options: return http_method::options;
    case http::verb::trace:   return http_method::trace;
    case http::verb::patch:   return http_method::patch;
    default:                  return nullopt;
    }
  }

  static http_request
  to_request (const http::request<http::string_body>& r, http_method m)
  {
    http_request q (m, string (r.target ()));

    for (const auto& f: r)
      q.headers.add (string (f.name_string ()), string (f.value ()));

    if (!r.body ().empty () || r.has_content_length () || r.chunked ())
      q.body = r.body ();

    return q;
  }

  // Note that a response to HEAD keeps the headers (Content-Length
  // included) of the response it stands for.
  //
  static http::response<http::string_body>
  to_response (const http_response& r, unsigned version, bool head)
  {
    http::response<http::string_body> res;
    res.version (version);
    res.result (r.status);

    for (const http_field& f: r.headers)
    {
      if (!head && (iequals (f.name, "Content-Length") ||
                    iequals (f.name, "Transfer-Encoding")))
        continue;

      if (iequals (f.name, "Connection"))
        continue;

      res.insert (f.name, f.value);
    }

    if (head)
      return res;

    // Informational, 204, and 304 responses have no body.
    //
    if (r.body && !(r.status < 200 || r.status == 204 || r.status == 304))
      res.body () = *r.body;

    res.prepare_payload ();
    return res;
  }

  relay_server::
  relay_server (asio::io_context& ioc,
                http_client& client,
                const server_options& o)
    : ioc_ (ioc),
      options_ (o),
      acceptor_ (ioc),
      handler_ (client, options_.rewrite),
      websocket_ (client.session ())
  {
  }

  void relay_server::
  listen ()
  {
    tcp::endpoint ep (asio::ip::make_address (options_.address),
                      options_.port);

    acceptor_.open (ep.protocol ());
    acceptor_.set_option (asio::socket_base::reuse_address (true));
    acceptor_.bind (ep);
    acceptor_.listen (asio::socket_base::max_listen_connections);
  }

  void relay_server::
  stop ()
  {
    beast::error_code ec;
    acceptor_.close (ec);
  }

  asio::awaitable<void> relay_server::
  run ()
  {
    for (;;)
    {
      beast::error_code ec;
      tcp::socket s (
        co_await acceptor_.async_accept (
          asio::redirect_error (asio::use_awaitable, ec)));

      if (!acceptor_.is_open ())
        co_return;

      if (ec)
      {
        log_warning () << "unable to accept connection: " << ec.message ();
        continue;
      }

      // A failed connection is logged and dropped, the rest carry on.
      //
      asio::co_spawn (ioc_,
                      serve (beast::tcp_stream (std::move (s))),
                      [] (exception_ptr e)
                      {
                        if (!e)
                          return;

                        try
                        {
                          rethrow_exception (e);
                        }
                        catch (const exception& x)
                        {
                          log_error () << x.what ();
                        }
                      });
    }
  }

  asio::awaitable<void> relay_server::
  serve (beast::tcp_stream s)
  {
    beast::error_code ec;
    beast::flat_buffer b;

    for (;;)
    {
      // No limit on what the client sends: it is relayed as is.
      //
      http::request_parser<http::string_body> p;
      p.body_limit (numeric_limits<uint64_t>::max ());

      co_await http::async_read (s, b, p,
                                 asio::redirect_error (asio::use_awaitable, ec));

      if (ec)
      {
        if (ec != http::error::end_of_stream)
          log_trace () << "connection: " << ec.message ();

        break;
      }

      http::request<http::string_body> req (p.release ());
      string path (target_path (string (req.target ())));

      if (path == relay_path && websocket::is_upgrade (req))
      {
        co_await websocket_.serve (std::move (s), std::move (req));
        co_return;
      }

      bool head (req.method () == http::verb::head);
      http_response r;

      if (path != relay_path)
        r = make_text_response (http_status::not_found, "Not Found");
      else if (optional<http_method> m = from_beast_verb (req.method ()))
        r = co_await handler_.handle (to_request (req, *m));
      else
        r = make_text_response (http_status::not_implemented,
                                "Not Implemented");

      http::response<http::string_body> res (
        to_response (r, req.version (), head));

      res.keep_alive (req.keep_alive ());

      co_await http::async_write (s, res,
                                  asio::redirect_error (asio::use_awaitable,
                                                        ec));

      if (ec || res.need_eof ())
        break;
    }

    s.socket ().shutdown (tcp::socket::shutdown_send, ec);
  }
}
