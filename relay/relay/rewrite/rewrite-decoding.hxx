#pragma once

#include <string>
#include <optional>

namespace relay
{
  // Decode a body according to its Content-Encoding value.
  //
  // Only gzip and deflate (zlib-wrapped or raw) are supported. An empty or
  // identity coding returns the body as is. Return nullopt if the coding is
  // not supported or the data is corrupt or truncated.
  //
  std::optional<std::string>
  decode_content (const std::string& body, const std::string& coding);
}
