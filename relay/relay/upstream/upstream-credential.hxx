#pragma once

#include <string>
#include <ostream>
#include <stdexcept>

namespace relay
{
  class invalid_credential: public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  // Upstream proxy credential and endpoint.
  //
  // Loaded once at startup and never modified afterwards. Everything that
  // talks to the upstream proxy holds a const reference to it.
  //
  struct upstream_credential
  {
    std::string host;
    std::string port;
    std::string username;
    std::string password;

    // Return the value for the Proxy-Authorization header.
    //
    std::string
    authorization () const;

    // Return host:port (IPv6 hosts keep their brackets).
    //
    std::string
    endpoint () const
    {
      return host + ':' + port;
    }
  };

  // Parse the username:password@host:port representation. An optional
  // http:// prefix and a trailing slash are tolerated.
  //
  upstream_credential
  parse_upstream_credential (const std::string&);

  // Print the credential with the password masked.
  //
  std::ostream&
  operator<< (std::ostream&, const upstream_credential&);
}
