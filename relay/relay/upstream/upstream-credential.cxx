#include <relay/upstream/upstream-credential.hxx>

#include <vector>
#include <charconv>

#include <openssl/evp.h>

using namespace std;

namespace relay
{
  string upstream_credential::
  authorization () const
  {
    string s (username + ':' + password);

    // EVP_EncodeBlock() writes 4 bytes for every 3 input bytes (rounded up)
    // plus the terminating NUL.
    //
    vector<unsigned char> b (4 * ((s.size () + 2) / 3) + 1);

    int n (EVP_EncodeBlock (b.data (),
                            reinterpret_cast<const unsigned char*> (s.data ()),
                            static_cast<int> (s.size ())));

    return "Basic " + string (reinterpret_cast<const char*> (b.data ()),
                              static_cast<size_t> (n));
  }

  upstream_credential
  parse_upstream_credential (const string& v)
  {
    string s (v);

    if (s.compare (0, 7, "http://") == 0)
      s.erase (0, 7);

    if (!s.empty () && s.back () == '/')
      s.pop_back ();

    // The password may well contain '@' so split on the last one.
    //
    size_t a (s.rfind ('@'));
    if (a == string::npos)
      throw invalid_credential ("missing '@' in upstream proxy");

    string ui (s.substr (0, a));
    string hp (s.substr (a + 1));

    size_t c (ui.find (':'));
    if (c == string::npos || c == 0)
      throw invalid_credential ("missing username:password in upstream proxy");

    upstream_credential r;
    r.username = ui.substr (0, c);
    r.password = ui.substr (c + 1);

    c = hp.rfind (':');
    if (c == string::npos || (hp.front () == '[' && hp[c - 1] != ']'))
      throw invalid_credential ("missing port in upstream proxy '" + hp + "'");

    r.host = hp.substr (0, c);
    r.port = hp.substr (c + 1);

    if (r.host.empty () || r.host == "[]")
      throw invalid_credential ("missing host in upstream proxy '" + hp + "'");

    unsigned int p (0);
    auto x (from_chars (r.port.data (), r.port.data () + r.port.size (), p));

    if (x.ec != errc () || x.ptr != r.port.data () + r.port.size () ||
        p == 0 || p > 65535)
      throw invalid_credential ("invalid port in upstream proxy '" + hp + "'");

    return r;
  }

  ostream&
  operator<< (ostream& o, const upstream_credential& c)
  {
    return o << c.username << ":***@" << c.endpoint ();
  }
}
