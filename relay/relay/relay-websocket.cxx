#include <relay/relay-websocket.hxx>

using namespace std;

namespace relay
{
  string
  websocket_target (const string& u)
  {
    url_parts p (parse_url (u));

    size_t n (u.find ("://"));

    if (p.scheme == "http")
      return "ws" + u.substr (n);

    if (p.scheme == "https")
      return "wss" + u.substr (n);

    return p.scheme + u.substr (n);
  }
}
