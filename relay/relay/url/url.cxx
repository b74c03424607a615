#include <relay/url/url.hxx>

#include <cctype>
#include <cstring>
#include <charconv>

using namespace std;

namespace relay
{
  const char relay_path[] = "/proxy";

  static inline bool
  alpha (char c)
  {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  }

  static inline bool
  digit (char c)
  {
    return c >= '0' && c <= '9';
  }

  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return s;
  }

  static const char*
  default_port (const string& scheme)
  {
    return scheme == "https" || scheme == "wss" ? "443" : "80";
  }

  // Return the length of the scheme prefix (without the colon) or 0 if the
  // string does not start with a scheme.
  //
  static size_t
  scheme_length (const string& s)
  {
    if (s.empty () || !alpha (s[0]))
      return 0;

    size_t i (1);
    for (; i != s.size (); ++i)
    {
      char c (s[i]);
      if (!alpha (c) && !digit (c) && c != '+' && c != '-' && c != '.')
        break;
    }

    return i != s.size () && s[i] == ':' ? i : 0;
  }

  bool
  is_absolute (const string& s)
  {
    size_t n (scheme_length (s));
    return n != 0 && s.compare (n, 3, "://") == 0;
  }

  bool
  has_scheme (const string& s)
  {
    return scheme_length (s) != 0;
  }

  // Characters that may not appear literally in the path, query, or
  // fragment. We escape them rather than fail, same as browsers do.
  //
  static inline bool
  unsafe (unsigned char c)
  {
    return c <= 0x20 || c >= 0x7f ||
           c == '"' || c == '<' || c == '>' || c == '`' ||
           c == '{' || c == '}' || c == '|' || c == '\\' || c == '^';
  }

  static const char hex_digits[] = "0123456789ABCDEF";

  static string
  escape_unsafe (const string& s, size_t from)
  {
    string r (s, 0, from);
    r.reserve (s.size ());

    for (size_t i (from); i != s.size (); ++i)
    {
      unsigned char c (static_cast<unsigned char> (s[i]));

      if (unsafe (c))
      {
        r += '%';
        r += hex_digits[c >> 4];
        r += hex_digits[c & 0x0f];
      }
      else
        r += static_cast<char> (c);
    }

    return r;
  }

  // Return the position where the authority of an absolute URL ends.
  //
  static size_t
  authority_end (const string& s)
  {
    size_t b (s.find ("://"));
    size_t e (s.find_first_of ("/?#", b + 3));
    return e == string::npos ? s.size () : e;
  }

  static bool
  valid_host (const string& h)
  {
    if (h.empty ())
      return false;

    if (h.front () == '[')
    {
      if (h.size () < 4 || h.back () != ']')
        return false;

      for (size_t i (1); i != h.size () - 1; ++i)
      {
        char c (h[i]);
        if (!isxdigit (static_cast<unsigned char> (c)) && c != ':' && c != '.')
          return false;
      }

      return true;
    }

    for (char c: h)
    {
      // Note that we have no IDNA support so non-ASCII hosts are rejected.
      //
      if (!alpha (c) && !digit (c) && c != '-' && c != '.' && c != '_' &&
          c != '~')
        return false;
    }

    return true;
  }

  string url_parts::
  authority () const
  {
    return port == default_port (scheme) ? host : host + ':' + port;
  }

  url_parts
  parse_url (const string& s)
  {
    if (!is_absolute (s))
      throw invalid_url ("not an absolute URL: '" + s + "'");

    url_parts r;

    size_t p (s.find ("://"));
    r.scheme = lower (s.substr (0, p));

    if (r.scheme != "http" && r.scheme != "https" &&
        r.scheme != "ws"   && r.scheme != "wss")
      throw invalid_url ("unsupported URL scheme '" + r.scheme + "'");

    size_t b (p + 3);
    size_t e (authority_end (s));

    string a (s.substr (b, e - b));

    // Drop user information, it has no meaning for us.
    //
    if (size_t i = a.rfind ('@'); i != string::npos)
      a.erase (0, i + 1);

    string port;
    bool colon (false);

    if (!a.empty () && a.front () == '[')
    {
      size_t c (a.find (']'));
      if (c == string::npos)
        throw invalid_url ("unterminated IPv6 address in '" + s + "'");

      r.host = a.substr (0, c + 1);

      if (c + 1 != a.size ())
      {
        if (a[c + 1] != ':')
          throw invalid_url ("invalid authority in '" + s + "'");

        colon = true;
        port = a.substr (c + 2);
      }
    }
    else if (size_t c = a.rfind (':'); c != string::npos)
    {
      r.host = a.substr (0, c);
      port = a.substr (c + 1);
      colon = true;
    }
    else
      r.host = a;

    if (!valid_host (r.host))
      throw invalid_url ("invalid host in '" + s + "'");

    if (colon && !port.empty ())
    {
      unsigned int v (0);
      auto x (from_chars (port.data (), port.data () + port.size (), v));

      if (x.ec != errc () || x.ptr != port.data () + port.size () ||
          v == 0 || v > 65535)
        throw invalid_url ("invalid port in '" + s + "'");

      r.port = std::to_string (v);
    }
    else
      r.port = default_port (r.scheme);

    string t (s.substr (e));

    if (size_t f = t.find ('#'); f != string::npos)
      t.erase (f);

    for (char c: t)
    {
      if (static_cast<unsigned char> (c) <= 0x20 || c == 0x7f)
        throw invalid_url ("invalid character in '" + s + "'");
    }

    if (t.empty () || t.front () != '/')
      t.insert (0, 1, '/');

    r.target = move (t);
    return r;
  }

  string
  origin (const string& url)
  {
    url_parts p (parse_url (url));
    return p.scheme + "://" + p.authority ();
  }

  // Remove the "." and ".." segments from an absolute path.
  //
  static string
  remove_dot_segments (const string& path)
  {
    vector<string> ss;
    bool trailing (false);

    for (size_t i (1); i <= path.size (); )
    {
      size_t j (path.find ('/', i));
      if (j == string::npos)
        j = path.size ();

      string s (path.substr (i, j - i));
      bool last (j == path.size ());

      if (s == ".")
        trailing = last;
      else if (s == "..")
      {
        if (!ss.empty ())
          ss.pop_back ();

        trailing = last;
      }
      else
      {
        ss.push_back (move (s));
        trailing = false;
      }

      i = j + 1;
    }

    string r;
    for (const string& s: ss)
      r += '/' + s;

    if (r.empty () || trailing)
      r += '/';

    return r;
  }

  string
  normalize (const string& raw, const optional<string>& base)
  {
    // Leading and trailing whitespace is not part of the URL (think of
    // attribute values split across lines).
    //
    size_t b (raw.find_first_not_of (" \t\r\n\f"));
    size_t e (raw.find_last_not_of (" \t\r\n\f"));

    string s (b == string::npos ? string () : raw.substr (b, e - b + 1));

    // Validate the base up front: a malformed base is an error even if we end
    // up not needing it.
    //
    optional<string> o;
    if (base)
      o = origin (*base);

    if (s.compare (0, 2, "//") == 0)
      s.insert (0, "https:");
    else if (o && !is_absolute (s))
    {
      string r (escape_unsafe (s, 0));

      if (r.empty () || r.front () != '/')
        r.insert (0, 1, '/');

      size_t q (r.find_first_of ("?#"));
      string p (q == string::npos ? r : r.substr (0, q));
      string t (q == string::npos ? string () : r.substr (q));

      s = *o + remove_dot_segments (p) + t;
      parse_url (s);
      return s;
    }

    if (!is_absolute (s))
      throw invalid_url ("not an absolute URL: '" + raw + "'");

    s = escape_unsafe (s, authority_end (s));
    parse_url (s);
    return s;
  }

  string
  encode_component (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      if (alpha (c) || digit (c) || strchr ("-_.!~*'()", c) != nullptr)
        r += c;
      else
      {
        unsigned char u (static_cast<unsigned char> (c));
        r += '%';
        r += hex_digits[u >> 4];
        r += hex_digits[u & 0x0f];
      }
    }

    return r;
  }

  static int
  hex_value (char c)
  {
    if (digit (c))
      return c - '0';

    c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return c >= 'a' && c <= 'f' ? c - 'a' + 10 : -1;
  }

  string
  decode_component (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (size_t i (0); i != s.size (); ++i)
    {
      char c (s[i]);

      if (c == '+')
        r += ' ';
      else if (c == '%' && i + 2 < s.size ())
      {
        int h (hex_value (s[i + 1]));
        int l (hex_value (s[i + 2]));

        if (h < 0 || l < 0)
          r += c;
        else
        {
          r += static_cast<char> (h * 16 + l);
          i += 2;
        }
      }
      else
        r += c;
    }

    return r;
  }

  string
  wrap (const string& url)
  {
    return string (relay_path) + "?url=" + encode_component (url);
  }

  query_params
  parse_query (const string& q)
  {
    query_params r;

    for (size_t i (0); i <= q.size (); )
    {
      size_t j (q.find ('&', i));
      if (j == string::npos)
        j = q.size ();

      if (j != i)
      {
        string p (q.substr (i, j - i));
        size_t e (p.find ('='));

        if (e == string::npos)
          r.emplace_back (decode_component (p), string ());
        else
          r.emplace_back (decode_component (p.substr (0, e)),
                          decode_component (p.substr (e + 1)));
      }

      i = j + 1;
    }

    return r;
  }

  optional<string>
  find_param (const query_params& ps, const string& n)
  {
    for (const auto& p: ps)
    {
      if (p.first == n)
        return p.second;
    }

    return nullopt;
  }

  string
  target_path (const string& t)
  {
    return t.substr (0, t.find_first_of ("?#"));
  }

  string
  target_query (const string& t)
  {
    size_t b (t.find ('?'));
    if (b == string::npos)
      return string ();

    size_t e (t.find ('#', b));
    return t.substr (b + 1, e == string::npos ? string::npos : e - b - 1);
  }

  string
  append_query (const string& url, const query_params& ps)
  {
    if (ps.empty ())
      return url;

    size_t f (url.find ('#'));

    string r (url.substr (0, f));
    string t (f == string::npos ? string () : url.substr (f));

    if (r.find ('?') == string::npos)
      r += '?';
    else if (r.back () != '?' && r.back () != '&')
      r += '&';

    bool first (true);
    for (const auto& p: ps)
    {
      if (!first)
        r += '&';

      r += encode_component (p.first);
      r += '=';
      r += encode_component (p.second);
      first = false;
    }

    return r + t;
  }
}
