#pragma once

#include <string>

#include <boost/asio.hpp>

#include <relay/http/http-request.hxx>
#include <relay/http/http-response.hxx>
#include <relay/rewrite/rewrite-classifier.hxx>

namespace relay
{
  namespace asio = boost::asio;

  // HTTP relay handler.
  //
  // Takes an inbound /proxy request, extracts and normalizes the target URL,
  // relays the request through the dispatcher, and turns the upstream
  // response into the response for the client. Every failure is answered
  // with an error response, nothing propagates to the caller.
  //
  // The dispatcher is anything that provides
  //
  //   asio::awaitable<http_response> request (const http_request&);
  //
  // and throws upstream_failure if it can't get a response.
  //
  template <typename D>
  class basic_relay_handler
  {
  public:
    using dispatcher_type = D;

    explicit
    basic_relay_handler (dispatcher_type& d,
                         const rewrite_options& o = rewrite_options ())
      : dispatcher_ (d), options_ (o) {}

    asio::awaitable<http_response>
    handle (const http_request& in);

    // Make the outbound request: the inbound method, headers, and body sent
    // to the target with the inbound query parameters other than url
    // appended.
    //
    static http_request
    relay_request (const http_request& in, const std::string& target);

  private:
    dispatcher_type& dispatcher_;
    rewrite_options options_;
  };
}

#include <relay/relay-handler.txx>
