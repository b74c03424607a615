#pragma once

#include <string>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <relay/upstream/upstream-credential.hxx>

namespace relay
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;

  // Thrown for any failure talking to the target through the upstream proxy:
  // resolution, connection, tunnel refusal, TLS, protocol errors, and
  // timeouts. Never retried.
  //
  class upstream_failure: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Make the CONNECT request asking the upstream proxy to open a tunnel to
  // the specified authority (host:port).
  //
  beast::http::request<beast::http::empty_body>
  make_connect_request (const upstream_credential&,
                        const std::string& authority);

  // Resolve the upstream proxy and connect the stream to it. The caller is
  // expected to have set the stream expiry.
  //
  asio::awaitable<void>
  connect_upstream (beast::tcp_stream&, const upstream_credential&);

  // Ask the (connected) upstream proxy to open a tunnel to host:port. On
  // return the stream talks to the target directly. Throw upstream_failure
  // if the proxy refuses.
  //
  asio::awaitable<void>
  open_tunnel (beast::tcp_stream&,
               const upstream_credential&,
               const std::string& authority);
}
