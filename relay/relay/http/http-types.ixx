#include <algorithm>

namespace relay
{
  // basic_http_headers
  //

  // Note that HTTP allows multiple headers with the same name (Set-Cookie
  // being the usual suspect) but set() enforces a single value.
  //
  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&n] (const field_type& f)
                          {
                            return iequals (f.name, n);
                          }));

    if (i == fields.end ())
    {
      fields.push_back (field_type (std::move (n), std::move (v)));
      return;
    }

    i->name = std::move (n);
    i->value = std::move (v);

    fields.erase (std::remove_if (i + 1, fields.end (),
                                  [&i] (const field_type& f)
                                  {
                                    return iequals (f.name, i->name);
                                  }),
                  fields.end ());
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  // Return the first occurrence if there are several.
  //
  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    for (const field_type& f: fields)
    {
      if (iequals (f.name, n))
        return f.value;
    }

    return std::nullopt;
  }

  template <typename S>
  inline bool basic_http_headers<S>::
  contains (const string_type& n) const
  {
    return get (n).has_value ();
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return iequals (f.name, n);
                                  }),
                  fields.end ());
  }
}
