#include <string>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <relay/relay-log.hxx>
#include <relay/relay-server.hxx>
#include <relay/relay-options.hxx>
#include <relay/http/http-client.hxx>
#include <relay/upstream/upstream-credential.hxx>

#include <relay/version.hxx>

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace relay;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "relay " << RELAY_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: relay [options]" << "\n"
        << "options:"               << "\n";

      opt.print_usage (o);

      return 0;
    }

    verbosity = opt.verbose ();

    // The upstream proxy is the one thing we can't do without. Note that the
    // environment variable keeps the password out of the process list.
    //
    string u;

    if (opt.upstream_specified ())
      u = opt.upstream ();
    else if (const char* e = getenv ("RELAY_UPSTREAM"))
      u = e;

    if (u.empty ())
    {
      cerr << "error: upstream proxy unspecified" << "\n"
           << "  info: use --upstream or RELAY_UPSTREAM environment variable"
           << "\n";
      return 1;
    }

    const upstream_credential cred (parse_upstream_credential (u));

    asio::io_context ioc;

    http_client_traits<> t;
    t.connect_timeout = opt.connect_timeout ();
    t.request_timeout = opt.request_timeout ();
    t.verify_ssl = opt.verify_ssl ();
    t.ssl_cert_file = opt.ssl_cert_file ();

    http_client client (ioc, cred, t);

    server_options so;
    so.address = opt.address ();
    so.port = opt.port ();
    so.rewrite.inject_base = opt.inject_base ();

    relay_server server (ioc, client, so);
    server.listen ();

    log_info () << "relaying through " << cred << ", listening on "
                << server.local_endpoint ();

    // Stop on SIGINT/SIGTERM. In-flight relays are dropped.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait (
      [&server, &ioc] (const boost::system::error_code& ec, int s)
      {
        if (ec)
          return;

        log_info () << "signal " << s << ", shutting down";

        server.stop ();
        ioc.stop ();
      });

    int exit_code (0);

    asio::co_spawn (
      ioc,
      server.run (),
      [&exit_code, &ioc] (exception_ptr ex)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
