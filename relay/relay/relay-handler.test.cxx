#include <relay/relay-handler.hxx>

#include <cassert>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <exception>

#include <relay/relay-log.hxx>
#include <relay/upstream/upstream-tunnel.hxx>

using namespace std;
using namespace relay;

// Dispatcher stand-in: records what it was asked to send and answers after a
// delay with whatever the test set up.
//
struct fake_dispatcher
{
  vector<http_request> requests;

  bool fail = false;
  http_response answer = http_response (200,
                                        {{"Content-Type", "text/plain"}},
                                        "hello");

  asio::awaitable<http_response>
  request (const http_request& r)
  {
    requests.push_back (r);

    // Take a turn through the event loop the way a real exchange would. The
    // later the request, the shorter the wait so that answers come back in
    // reverse.
    //
    asio::steady_timer t (co_await asio::this_coro::executor);
    t.expires_after (chrono::milliseconds (50 - 5 * (requests.size () % 10)));
    co_await t.async_wait (asio::use_awaitable);

    if (fail)
      throw upstream_failure (r.url + ": connection refused");

    http_response a (answer);

    // Echo the target for plain text so concurrent callers can tell their
    // answers apart.
    //
    if (a.content_type () == "text/plain")
      a.set_body (r.url);

    co_return a;
  }
};

using handler = basic_relay_handler<fake_dispatcher>;

static void
rethrow (exception_ptr e)
{
  if (e)
    rethrow_exception (e);
}

static http_response
handle (handler& h, http_request r)
{
  asio::io_context ioc;
  optional<http_response> res;

  asio::co_spawn (ioc,
                  [&h, &res, r = move (r)] () -> asio::awaitable<void>
                  {
                    res = co_await h.handle (r);
                  },
                  rethrow);

  ioc.run ();

  assert (res);
  return *res;
}

static http_response
get (handler& h, const string& target)
{
  return handle (h, http_request (http_method::get, target));
}

static void
test_missing ()
{
  fake_dispatcher d;
  handler h (d);

  for (const char* t: {"/proxy", "/proxy?url=", "/proxy?u=https%3A%2F%2Fe.com"})
  {
    http_response r (get (h, t));

    assert (r.status == 400);
    assert (*r.body == "Missing target URL");
  }

  assert (d.requests.empty ());
}

static void
test_invalid ()
{
  fake_dispatcher d;
  handler h (d);

  for (const char* t: {"/proxy?url=example.com",
                       "/proxy?url=not%20a%20url",
                       "/proxy?url=ftp%3A%2F%2Fexample.com%2F",
                       "/proxy?url=https%3A%2F%2F%2Fx"})
  {
    http_response r (get (h, t));

    assert (r.status == 400);
    assert (*r.body == "Invalid target URL");
  }

  assert (d.requests.empty ());
}

static void
test_failure ()
{
  fake_dispatcher d;
  d.fail = true;

  handler h (d);
  http_response r (get (h, "/proxy?url=https%3A%2F%2Fexample.com%2F"));

  assert (d.requests.size () == 1);
  assert (r.status == 500);
  assert (*r.body == "Proxy Error");
}

static void
test_relay ()
{
  fake_dispatcher d;
  d.answer = http_response (200,
                            {{"Content-Type", "text/html"}},
                            "<img src=\"/i.png\">");

  handler h (d);

  http_request in (http_method::post,
                   "/proxy?url=https%3A%2F%2Fexample.com%2Fa&q=1&r=a%20b",
                   {{"Cookie", "s=1"}, {"Host", "localhost:3000"}},
                   string ("x=1"));

  http_response r (handle (h, in));

  assert (d.requests.size () == 1);

  const http_request& o (d.requests.front ());
  assert (o.method == http_method::post);
  assert (o.url == "https://example.com/a?q=1&r=a%20b");
  assert (*o.body == "x=1");
  assert (*o.get_header ("Cookie") == "s=1");

  assert (r.status == 200);
  assert (*r.body == "<img src=\"/proxy?url=https%3A%2F%2Fexample.com%2Fi.png\">");
}

static void
test_redirect ()
{
  fake_dispatcher d;
  d.answer = http_response (301, {{"Location", "/login?next=%2F"}}, "");

  handler h (d);
  http_response r (get (h, "/proxy?url=http%3A%2F%2Fexample.com%2Fa%2Fb"));

  assert (r.status == 302);
  assert (*r.location () ==
          "/proxy?url=http%3A%2F%2Fexample.com%2Flogin%3Fnext%3D%252F");
}

// Relays on one event loop don't wait for each other and don't mix up their
// answers.
//
static void
test_concurrent ()
{
  fake_dispatcher d;
  handler h (d);

  asio::io_context ioc;

  const size_t n (8);
  vector<optional<http_response>> rs (n);

  for (size_t i (0); i != n; ++i)
  {
    asio::co_spawn (
      ioc,
      [&h, &rs, i] () -> asio::awaitable<void>
      {
        string t ("/proxy?url=https%3A%2F%2Fexample.com%2F" + to_string (i));
        rs[i] = co_await h.handle (http_request (http_method::get, t));
      },
      rethrow);
  }

  auto start (chrono::steady_clock::now ());
  ioc.run ();

  // Each answer takes up to 50ms. Sequentially that would be several times
  // longer.
  //
  assert (chrono::steady_clock::now () - start < chrono::milliseconds (200));

  assert (d.requests.size () == n);

  for (size_t i (0); i != n; ++i)
  {
    assert (rs[i]);
    assert (rs[i]->status == 200);
    assert (*rs[i]->body == "https://example.com/" + to_string (i));
  }
}

int
main ()
{
  verbosity = 0;

  test_missing ();
  test_invalid ();
  test_failure ();
  test_relay ();
  test_redirect ();
  test_concurrent ();
}
