#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <initializer_list>

namespace relay
{
  // HTTP method (verb).
  //
  // These are the methods we relay. Anything else is answered with 501 by
  // the server before it reaches the handler.
  //
  enum class http_method
  {
    get,
    head,
    post,
    put,
    delete_,
    options,
    trace,
    patch
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes the relay produces itself are named. Upstream codes are
  // carried through as is, named or not.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    found                 = 302,
    bad_request           = 400,
    not_found             = 404,
    internal_server_error = 500,
    not_implemented       = 501
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Case-insensitive comparison of header names (RFC 7230).
  //
  bool
  iequals (const std::string&, const std::string&) noexcept;

  // Header field as it goes on the wire: the name keeps its case.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  // Ordered header fields with case-insensitive lookup.
  //
  // Order of insertion is preserved since that is what ends up on the wire.
  // Repeated fields (Set-Cookie, Cookie) are kept as separate entries.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;

    std::vector<field_type> fields;

    basic_http_headers () = default;

    basic_http_headers (std::initializer_list<field_type> f)
        : fields (f) {}

    // Replace every field with this name by a single one at the position of
    // the first (appended if there is none).
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    // Return the value of the first field with this name.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    void
    remove (const string_type& name);

    auto begin ()       noexcept {return fields.begin ();}
    auto begin () const noexcept {return fields.begin ();}
    auto end ()         noexcept {return fields.end ();}
    auto end ()   const noexcept {return fields.end ();}
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;
}

#include <relay/http/http-types.ixx>
