#include <relay/url/url.hxx>

namespace relay
{
  template <typename S, typename B>
  inline std::optional<typename basic_http_request<S, B>::string_type>
  basic_http_request<S, B>::
  param (const string_type& n) const
  {
    return find_param (parse_query (target_query (url)), n);
  }
}
