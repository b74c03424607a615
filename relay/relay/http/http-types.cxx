#include <relay/http/http-types.hxx>

#include <cctype>

using namespace std;

namespace relay
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::post:    return "POST";
      case http_method::put:     return "PUT";
      case http_method::delete_: return "DELETE";
      case http_method::options: return "OPTIONS";
      case http_method::trace:   return "TRACE";
      case http_method::patch:   return "PATCH";
    }
    return "GET";
  }

  bool
  iequals (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }
}
