#include <relay/relay-log.hxx>

#include <iostream>

using namespace std;

namespace relay
{
  uint16_t verbosity (1);

  diag_record::
  ~diag_record ()
  {
    if (active_)
    {
      os_ << '\n';
      cerr << os_.str () << flush;
    }
  }
}
