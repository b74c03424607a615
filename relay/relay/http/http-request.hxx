#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <relay/http/http-types.hxx>

namespace relay
{
  // HTTP request.
  //
  // Used both for what the client sent us (url is the request target, for
  // example "/proxy?url=...") and for what we relay upstream (url is the
  // absolute target URL).
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method               method = http_method::get;
    string_type               url;
    headers_type              headers;
    std::optional<body_type>  body;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
        : method (m), url (std::move (u)) {}

    basic_http_request (http_method m, string_type u, headers_type h)
        : method (m), url (std::move (u)), headers (std::move (h)) {}

    basic_http_request (http_method m,
                        string_type u,
                        headers_type h,
                        std::optional<body_type> b)
        : method (m),
          url (std::move (u)),
          headers (std::move (h)),
          body (std::move (b)) {}

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Return the value of a query parameter of the request target.
    //
    std::optional<string_type>
    param (const string_type& name) const;
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S, B>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url;
  }

  using http_request = basic_http_request<std::string, std::string>;
}

#include <relay/http/http-request.ixx>
