#pragma once

#include <string>
#include <ostream>

#include <relay/http/http-response.hxx>

namespace relay
{
  // What to do with an upstream response, in priority order.
  //
  enum class content_class
  {
    redirect, // 3xx with Location: relay redirect.
    html,     // text/html: link rewriting.
    json,     // application/json: re-serialize.
    text,     // text/*, JavaScript: pass through.
    binary    // Anything else: pass through.
  };

  std::string
  to_string (content_class);

  inline std::ostream&
  operator<< (std::ostream& o, content_class c)
  {
    return o << to_string (c);
  }

  struct rewrite_options
  {
    // Inject <base href="{origin}"> into HTML documents without one.
    //
    bool inject_base = false;
  };

  content_class
  classify (const http_response&);

  // Classify the upstream response to the target and build the response for
  // the client.
  //
  // Redirects are answered with our own 302 to the wrapped location. For
  // everything else the upstream status is preserved along with the content
  // type, length, coding, language, and caching headers. Transformation
  // failures (undecodable coding, invalid JSON, unresolvable links) never
  // fail the response: the affected part is passed through unmodified.
  //
  http_response
  classify_and_rewrite (const http_response& upstream,
                        const std::string& target,
                        const rewrite_options& = rewrite_options ());
}
