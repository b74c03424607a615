#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <stdexcept>

namespace relay
{
  // Thrown when a target URL (or a base it is resolved against) cannot be
  // parsed. Callers surface this as a client error, never as a server fault.
  //
  class invalid_url: public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  // Components of an absolute URL.
  //
  // The port is always filled in, with the scheme default if the URL does
  // not specify one.
  // The target is the path plus query, with the fragment dropped since it is
  // never sent on the wire.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // Return true if the host is a bracketed IPv6 literal.
    //
    bool
    ipv6 () const noexcept
    {
      return !host.empty () && host.front () == '[';
    }

    // Return the host without IPv6 brackets (suitable for name resolution).
    //
    std::string
    bare_host () const
    {
      return ipv6 () ? host.substr (1, host.size () - 2) : host;
    }

    bool
    secure () const noexcept
    {
      return scheme == "https" || scheme == "wss";
    }

    // Return host[:port], the latter only if it is not the scheme default.
    //
    std::string
    authority () const;
  };

  // Parse an absolute http, https, ws, or wss URL. Throw invalid_url if the
  // string is not one.
  //
  url_parts
  parse_url (const std::string&);

  // Return true if the string starts with a scheme followed by "://".
  //
  bool
  is_absolute (const std::string&);

  // Return true if the string starts with any scheme (e.g., "mailto:").
  //
  bool
  has_scheme (const std::string&);

  // Return the origin (scheme://host[:port]) of an absolute URL.
  //
  std::string
  origin (const std::string& url);

  // Canonicalize a client-supplied URL.
  //
  // Protocol-relative references ("//host/path") get the https scheme. If a
  // base is given and the reference is not absolute, it is resolved against
  // the origin of the base, discarding the base path. Note that this means
  // path-relative references such as "./img.png" on a nested page resolve
  // against the site root. A valid absolute URL is returned unchanged.
  //
  std::string
  normalize (const std::string& raw,
             const std::optional<std::string>& base = std::nullopt);

  // Percent-encode a string the way encodeURIComponent does.
  //
  std::string
  encode_component (const std::string&);

  // Decode percent-escapes and '+' (query string semantics). Malformed escapes
  // are kept as is.
  //
  std::string
  decode_component (const std::string&);

  // Wrap an absolute URL into a relay link (/proxy?url=<encoded>).
  //
  std::string
  wrap (const std::string& url);

  extern const char relay_path[];

  // Query string handling.
  //
  using query_params = std::vector<std::pair<std::string, std::string>>;

  query_params
  parse_query (const std::string& query);

  // Return the first value of the named parameter.
  //
  std::optional<std::string>
  find_param (const query_params&, const std::string& name);

  // Split a request target into its path and query (without the '?').
  //
  std::string
  target_path (const std::string& target);

  std::string
  target_query (const std::string& target);

  // Append encoded parameters to the query of a URL (before any fragment).
  //
  std::string
  append_query (const std::string& url, const query_params&);
}
