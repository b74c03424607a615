#include <charconv>

namespace relay
{
  // Parse the Content-Length header.
  //
  // Returns nullopt if the header is missing or is not a valid non-negative
  // integer.
  //
  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    std::uint64_t n (0);

    // Note that we use std::from_chars for locale-independent parsing.
    //
    auto r (std::from_chars (v->data (), v->data () + v->size (), n));

    if (r.ec == std::errc () && r.ptr == v->data () + v->size ())
      return n;

    return std::nullopt;
  }
}
