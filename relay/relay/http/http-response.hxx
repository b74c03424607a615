#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <relay/http/http-types.hxx>

namespace relay
{
  // HTTP response.
  //
  // The body is kept as raw bytes: no charset or content coding assumptions
  // are made at this level.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    std::uint16_t            status = 200;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () = default;

    explicit
    basic_http_response (http_status s)
      : status (static_cast<std::uint16_t> (s)) {}

    basic_http_response (std::uint16_t s, headers_type h)
      : status (s), headers (std::move (h)) {}

    basic_http_response (std::uint16_t s, headers_type h, body_type b)
      : status (s), headers (std::move (h)), body (std::move (b)) {}

    bool
    is_redirection () const noexcept
    {
      return status >= 300 && status < 400;
    }

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Return the content type, application/octet-stream if there is none.
    //
    string_type
    content_type () const
    {
      auto v (get_header (string_type ("Content-Type")));
      return v ? *v : string_type ("application/octet-stream");
    }

    std::optional<std::uint64_t>
    content_length () const;

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    void
    set_body (body_type b)
    {
      body = std::move (b);
    }
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    return o << r.status;
  }

  using http_response = basic_http_response<std::string, std::string>;

  // Make a plain text response (used for the relay's own error answers).
  //
  inline http_response
  make_text_response (http_status s, std::string text)
  {
    http_response r (s);
    r.set_header ("Content-Type", "text/html; charset=utf-8");
    r.set_body (std::move (text));
    return r;
  }
}

#include <relay/http/http-response.ixx>
