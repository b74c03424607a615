#include <relay/rewrite/rewrite-decoding.hxx>

#include <cctype>
#include <limits>
#include <cstddef>
#include <initializer_list>

#include <miniz.h>

using namespace std;

namespace relay
{
  // Inflate a zlib (positive window bits) or raw deflate (negative window
  // bits) stream.
  //
  static optional<string>
  inflate (const unsigned char* d, size_t n, int wbits)
  {
    mz_stream s {};

    if (mz_inflateInit2 (&s, wbits) != MZ_OK)
      return nullopt;

    // The input count is an unsigned int so larger bodies are fed in chunks.
    //
    const size_t chunk (numeric_limits<unsigned int>::max ());

    s.next_in = d;
    s.avail_in = 0;

    string r;
    unsigned char buf[16384];
    int st;

    do
    {
      if (s.avail_in == 0 && n != 0)
      {
        size_t k (n < chunk ? n : chunk);
        s.avail_in = static_cast<unsigned int> (k);
        n -= k;
      }

      s.next_out = buf;
      s.avail_out = sizeof (buf);

      st = mz_inflate (&s, MZ_NO_FLUSH);

      if (st != MZ_OK && st != MZ_STREAM_END)
        break;

      r.append (reinterpret_cast<const char*> (buf),
                sizeof (buf) - s.avail_out);
    }
    while (st != MZ_STREAM_END &&
           (s.avail_in != 0 || n != 0 || s.avail_out == 0));

    mz_inflateEnd (&s);

    if (st != MZ_STREAM_END)
      return nullopt;

    return r;
  }

  // Skip the gzip member header (RFC 1952) and return the offset of the
  // deflate data or 0 if the header is invalid.
  //
  static size_t
  gzip_header (const unsigned char* d, size_t n)
  {
    const unsigned char fhcrc (0x02), fextra (0x04), fname (0x08),
                        fcomment (0x10);

    if (n < 18 || d[0] != 0x1f || d[1] != 0x8b || d[2] != 8)
      return 0;

    unsigned char f (d[3]);
    size_t p (10);

    if (f & fextra)
    {
      if (p + 2 > n)
        return 0;

      p += 2 + (d[p] | (static_cast<size_t> (d[p + 1]) << 8));
    }

    for (unsigned char z: {fname, fcomment})
    {
      if (f & z)
      {
        while (p < n && d[p] != 0)
          ++p;

        ++p;
      }
    }

    if (f & fhcrc)
      p += 2;

    return p < n ? p : 0;
  }

  optional<string>
  decode_content (const string& body, const string& coding)
  {
    string c;
    for (char x: coding)
    {
      if (x != ' ' && x != '\t')
        c += static_cast<char> (tolower (static_cast<unsigned char> (x)));
    }

    if (c.empty () || c == "identity")
      return body;

    const unsigned char* d (reinterpret_cast<const unsigned char*> (body.data ()));
    size_t n (body.size ());

    if (c == "gzip" || c == "x-gzip")
    {
      size_t p (gzip_header (d, n));
      if (p == 0)
        return nullopt;

      // The member ends with CRC32 and ISIZE which the raw inflate stops
      // short of. We don't verify them: the deflate stream has already told
      // us it is complete.
      //
      return inflate (d + p, n - p, -MZ_DEFAULT_WINDOW_BITS);
    }

    if (c == "deflate")
    {
      // RFC 9110 says zlib-wrapped but some servers send raw deflate, so
      // try both.
      //
      if (auto r = inflate (d, n, MZ_DEFAULT_WINDOW_BITS))
        return r;

      return inflate (d, n, -MZ_DEFAULT_WINDOW_BITS);
    }

    return nullopt;
  }
}
