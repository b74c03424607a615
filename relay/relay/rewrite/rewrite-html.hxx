#pragma once

#include <string>
#include <optional>

namespace relay
{
  // HTML link rewriting.
  //
  // This is plain text rewriting driven by the attribute pattern
  //
  //   (href|src|action)=["'](.*?)["']
  //
  // matched case-insensitively, not an HTML parse. It will miss unquoted or
  // spaced-out attributes and will happily rewrite matches inside scripts
  // and comments. That is how it is meant to behave: a real parser would
  // change what gets rewritten on malformed markup.
  //

  // Return the relay link for a single attribute value or nullopt if the
  // value should be left as is. Absolute and protocol-relative links are
  // normalized, relative ones are resolved against the origin of the target.
  // Empty and fragment-only values, values with a non-hierarchical scheme
  // (javascript:, data:, mailto:, etc), and values that fail to normalize are
  // left alone.
  //
  std::optional<std::string>
  rewrite_link (const std::string& link, const std::string& target);

  // Rewrite every matched attribute value in the document. A rewritten value
  // is always written back double-quoted.
  //
  std::string
  rewrite_links (const std::string& html, const std::string& target);

  // Insert <base href="{origin of target}"> right after the opening head tag
  // unless the document already has a base tag (or has no head tag).
  //
  std::string
  inject_base (const std::string& html, const std::string& target);
}
