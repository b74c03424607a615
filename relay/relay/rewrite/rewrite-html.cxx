#include <relay/rewrite/rewrite-html.hxx>

#include <cctype>
#include <cstring>

#include <relay/url/url.hxx>

using namespace std;

namespace relay
{
  static inline bool
  iequal (char x, char y)
  {
    return tolower (static_cast<unsigned char> (x)) ==
           tolower (static_cast<unsigned char> (y));
  }

  // Return true if the string has the (lower-case) prefix at the position.
  //
  static bool
  iprefix (const string& s, size_t p, const char* x)
  {
    size_t n (strlen (x));

    if (s.size () - p < n)
      return false;

    for (size_t i (0); i != n; ++i)
    {
      if (!iequal (s[p + i], x[i]))
        return false;
    }

    return true;
  }

  static size_t
  ifind (const string& s, const char* x, size_t p = 0)
  {
    for (; p < s.size (); ++p)
    {
      if (iprefix (s, p, x))
        return p;
    }

    return string::npos;
  }

  optional<string>
  rewrite_link (const string& l, const string& t)
  {
    if (l.empty () || l.front () == '#')
      return nullopt;

    if (has_scheme (l) && !is_absolute (l))
      return nullopt;

    try
    {
      return wrap (normalize (l, t));
    }
    catch (const invalid_url&)
    {
      return nullopt;
    }
  }

  string
  rewrite_links (const string& h, const string& t)
  {
    static const char* const attrs[] = {"href", "src", "action"};

    string r;
    r.reserve (h.size () + h.size () / 8);

    size_t c (0); // Copied up to.

    for (size_t i (0); i < h.size (); )
    {
      // Match the pattern at this position. Note that the lazy (.*?) stops
      // at the first quote of either kind and, like '.', does not cross a
      // line break.
      //
      size_t n (0), vb (0), ve (0);

      for (const char* a: attrs)
      {
        size_t an (strlen (a));

        if (!iprefix (h, i, a)       ||
            i + an + 1 >= h.size ()  ||
            h[i + an] != '='         ||
            (h[i + an + 1] != '"' && h[i + an + 1] != '\''))
          continue;

        vb = i + an + 2;
        ve = h.find_first_of ("\"'\r\n", vb);

        if (ve != string::npos && h[ve] != '\r' && h[ve] != '\n')
          n = an;

        break;
      }

      if (n == 0)
      {
        ++i;
        continue;
      }

      r.append (h, c, i - c);

      if (auto w = rewrite_link (h.substr (vb, ve - vb), t))
      {
        r.append (h, i, n);
        r += "=\"";
        r += *w;
        r += '"';
      }
      else
        r.append (h, i, ve + 1 - i);

      i = c = ve + 1;
    }

    r.append (h, c, string::npos);
    return r;
  }

  string
  inject_base (const string& h, const string& t)
  {
    if (ifind (h, "<base") != string::npos)
      return h;

    for (size_t p (ifind (h, "<head")); p != string::npos;
         p = ifind (h, "<head", p + 5))
    {
      // Skip <header> and friends.
      //
      size_t n (p + 5);
      if (n == h.size ())
        break;

      char c (h[n]);
      if (c != '>' && c != '/' && !isspace (static_cast<unsigned char> (c)))
        continue;

      size_t e (h.find ('>', n));
      if (e == string::npos)
        break;

      string r (h);
      r.insert (e + 1, "<base href=\"" + origin (t) + "\">");
      return r;
    }

    return h;
  }
}
