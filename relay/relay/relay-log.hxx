#pragma once

#include <string>
#include <sstream>
#include <cstdint>

namespace relay
{
  // Diagnostics verbosity level:
  //
  // 0 - errors only
  // 1 - warnings and information (default)
  // 2 - per-request and per-connection trace
  //
  extern std::uint16_t verbosity;

  // Diagnostics record.
  //
  // Accumulates the line and writes it to stderr in one go on destruction so
  // that records from interleaved coroutines don't mix. An inactive record
  // (level above the verbosity) discards everything.
  //
  class diag_record
  {
  public:
    diag_record (const char* prefix, bool active)
      : active_ (active)
    {
      if (active_)
        os_ << prefix;
    }

    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    ~diag_record ();

    template <typename T>
    diag_record&
    operator<< (const T& x)
    {
      if (active_)
        os_ << x;

      return *this;
    }

  private:
    bool active_;
    std::ostringstream os_;
  };

  inline diag_record
  log_error ()
  {
    return diag_record ("error: ", true);
  }

  inline diag_record
  log_warning ()
  {
    return diag_record ("warning: ", verbosity >= 1);
  }

  inline diag_record
  log_info ()
  {
    return diag_record ("info: ", verbosity >= 1);
  }

  inline diag_record
  log_trace ()
  {
    return diag_record ("trace: ", verbosity >= 2);
  }
}
