#include <relay/http/http-client.hxx>

#include <vector>

using namespace std;

namespace relay
{
  http_headers
  browser_headers ()
  {
    // Note that we only advertise the codings we can decode ourselves since
    // HTML and JSON bodies may need rewriting.
    //
    return http_headers {
      {"User-Agent",
       "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
       "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"},
      {"Accept",
       "text/html,application/xhtml+xml,application/xml;q=0.9,"
       "image/avif,image/webp,*/*;q=0.8"},
      {"Accept-Language", "en-US,en;q=0.9"},
      {"Accept-Encoding", "gzip, deflate"},
      {"Connection", "keep-alive"},
      {"Cache-Control", "max-age=0"},
      {"Sec-Fetch-Dest", "document"},
      {"Sec-Fetch-Mode", "navigate"},
      {"Sec-Fetch-Site", "none"},
      {"Sec-Fetch-User", "?1"}};
  }

  static bool
  dropped (const string& n)
  {
    static const char* const ns[] = {
      "host", "origin", "referer",
      "content-length", "transfer-encoding", "te", "trailer", "upgrade",
      "keep-alive", "expect", "proxy-authorization", "proxy-connection"};

    for (const char* x: ns)
    {
      if (iequals (n, x))
        return true;
    }

    return false;
  }

  // Reduce an Accept-Encoding list to the codings decode_content() handles
  // (see rewrite-decoding.hxx), keeping their parameters. Falls back to
  // identity if nothing is left.
  //
  static string
  decodable_codings (const string& v)
  {
    string r;

    for (size_t b (0); b <= v.size ();)
    {
      size_t e (v.find (',', b));
      if (e == string::npos)
        e = v.size ();

      string c (v, b, e - b);
      b = e + 1;

      size_t i (c.find_first_not_of (" \t"));
      if (i == string::npos)
        continue;

      c.erase (0, i);
      c.erase (c.find_last_not_of (" \t") + 1);

      string n (c, 0, c.find (';'));
      n.erase (n.find_last_not_of (" \t") + 1);

      if (iequals (n, "gzip")    ||
          iequals (n, "x-gzip")  ||
          iequals (n, "deflate") ||
          iequals (n, "identity"))
      {
        if (!r.empty ())
          r += ", ";

        r += c;
      }
    }

    return r.empty () ? string ("identity") : r;
  }

  http_headers
  curate_headers (const http_headers& defaults, const http_headers& inbound)
  {
    http_headers r (defaults);

    // The first inbound occurrence of a name replaces the default, subsequent
    // ones (e.g., several Cookie lines) are appended.
    //
    vector<string> seen;

    for (const http_field& f: inbound)
    {
      if (dropped (f.name))
        continue;

      bool s (false);
      for (const string& n: seen)
      {
        if (iequals (n, f.name))
        {
          s = true;
          break;
        }
      }

      if (s)
        r.add (f.name, f.value);
      else
      {
        r.set (f.name, f.value);
        seen.push_back (f.name);
      }
    }

    // Bodies that need rewriting must come in a coding we can undo. Several
    // Accept-Encoding lines make up one list.
    //
    if (r.contains ("Accept-Encoding"))
    {
      string ae;
      for (const http_field& f: r)
      {
        if (iequals (f.name, "Accept-Encoding"))
        {
          if (!ae.empty ())
            ae += ", ";

          ae += f.value;
        }
      }

      r.set ("Accept-Encoding", decodable_codings (ae));
    }

    return r;
  }
}
