#include <relay/rewrite/rewrite-classifier.hxx>

#include <cctype>
#include <optional>

#include <boost/json.hpp>

#include <relay/url/url.hxx>
#include <relay/rewrite/rewrite-html.hxx>
#include <relay/rewrite/rewrite-decoding.hxx>

using namespace std;

namespace relay
{
  namespace json = boost::json;

  string
  to_string (content_class c)
  {
    switch (c)
    {
    case content_class::redirect: return "redirect";
    case content_class::html:     return "html";
    case content_class::json:     return "json";
    case content_class::text:     return "text";
    case content_class::binary:   return "binary";
    }
    return "binary";
  }

  static content_class
  classify_content (const http_response& r)
  {
    string t (r.content_type ());
    for (char& c: t)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    size_t b (t.find_first_not_of (" \t"));
    if (b != string::npos)
      t.erase (0, b);

    if (t.find ("text/html") != string::npos)
      return content_class::html;

    if (t.find ("application/json") != string::npos)
      return content_class::json;

    if (t.compare (0, 5, "text/") == 0                        ||
        t.find ("application/javascript") != string::npos      ||
        t.find ("application/x-javascript") != string::npos)
      return content_class::text;

    return content_class::binary;
  }

  content_class
  classify (const http_response& r)
  {
    if (r.is_redirection () && r.location ())
      return content_class::redirect;

    return classify_content (r);
  }

  // Headers copied from the upstream response.
  //
  static const char* const copied_headers[] = {
    "Content-Type",
    "Content-Length",
    "Content-Encoding",
    "Content-Language",
    "Cache-Control",
    "Expires",
    "Last-Modified",
    "ETag"};

  // Reparse and serialize a JSON document. Return nullopt if it is not valid
  // JSON.
  //
  static optional<string>
  reserialize (const string& s)
  {
    boost::system::error_code e;
    json::value v (json::parse (s, e));

    if (e)
      return nullopt;

    return json::serialize (v);
  }

  http_response
  classify_and_rewrite (const http_response& u,
                        const string& target,
                        const rewrite_options& o)
  {
    content_class c (classify (u));

    if (c == content_class::redirect)
    {
      // Resolve against the origin of the target, not the target itself. A
      // location with a scheme we don't relay (mailto:, say) would otherwise
      // resolve as a path.
      //
      string l (*u.location ());
      optional<string> w;

      if (!has_scheme (l) || is_absolute (l))
      {
        try
        {
          w = wrap (normalize (l, origin (target)));
        }
        catch (const invalid_url&)
        {
          // Leave w empty and pass through.
        }
      }

      if (w)
      {
        http_response r (http_status::found);
        r.set_header ("Location", *w);
        r.set_header ("Content-Type", "text/plain; charset=utf-8");
        r.set_body ("Found. Redirecting to " + *w);
        return r;
      }

      // Unusable location. Hand the response over as is.
      //
      c = classify_content (u);
    }

    http_response r (u.status, http_headers ());

    for (const char* n: copied_headers)
    {
      if (auto v = u.get_header (n))
        r.set_header (n, *v);
    }

    r.set_header ("Content-Type", u.content_type ());

    string body (u.body ? *u.body : string ());

    if ((c == content_class::html || c == content_class::json) &&
        !body.empty ())
    {
      auto coding (u.get_header ("Content-Encoding"));
      optional<string> d (decode_content (body, coding ? *coding : ""));

      // If we can't decode the body we can't transform it either so it goes
      // through untouched, coding header and all.
      //
      if (d)
      {
        optional<string> x;

        if (c == content_class::html)
        {
          string h (rewrite_links (*d, target));

          // Inject after rewriting so that the base itself stays pointed at
          // the target.
          //
          if (o.inject_base)
            h = inject_base (h, target);

          x = move (h);
        }
        else
          x = reserialize (*d);

        if (x)
        {
          body = move (*x);
          r.headers.remove ("Content-Encoding");
          r.set_header ("Content-Length", std::to_string (body.size ()));
        }
      }
    }

    r.set_body (move (body));
    return r;
  }
}
