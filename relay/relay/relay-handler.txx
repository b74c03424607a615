#include <optional>
#include <utility>

#include <relay/url/url.hxx>
#include <relay/relay-log.hxx>
#include <relay/upstream/upstream-tunnel.hxx>

namespace relay
{
  template <typename D>
  http_request basic_relay_handler<D>::
  relay_request (const http_request& in, const std::string& target)
  {
    query_params ps;
    for (auto& p: parse_query (target_query (in.url)))
    {
      if (p.first != "url")
        ps.push_back (std::move (p));
    }

    return http_request (in.method,
                         append_query (target, ps),
                         in.headers,
                         in.body);
  }

  template <typename D>
  asio::awaitable<http_response> basic_relay_handler<D>::
  handle (const http_request& in)
  {
    log_trace () << in << ": received";

    std::optional<std::string> raw (in.param ("url"));

    if (!raw || raw->empty ())
    {
      log_trace () << in << ": no target URL";
      co_return make_text_response (http_status::bad_request,
                                    "Missing target URL");
    }

    std::string target;

    try
    {
      target = normalize (*raw);
    }
    catch (const invalid_url& e)
    {
      log_trace () << in << ": " << e.what ();
      co_return make_text_response (http_status::bad_request,
                                    "Invalid target URL");
    }

    http_request out (relay_request (in, target));

    log_info () << "relaying " << out;

    http_response u;

    try
    {
      u = co_await dispatcher_.request (out);
    }
    catch (const upstream_failure& e)
    {
      log_error () << e.what ();
      co_return make_text_response (http_status::internal_server_error,
                                    "Proxy Error");
    }

    log_trace () << out << ": upstream status " << u.status;

    // Note that classification looks at the target as normalized, not as
    // extended with the extra parameters: only its origin matters.
    //
    http_response r (classify_and_rewrite (u, target, options_));

    log_trace () << out << ": " << classify (u) << ", sending " << r.status;

    co_return r;
  }
}
