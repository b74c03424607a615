#include <openssl/ssl.h>

namespace relay
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);

    // Targets are accepted whatever their certificate unless asked
    // otherwise, the same as a browser with the warning clicked through.
    //
    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    if (traits_.ssl_cert_file.empty ())
      ssl_ctx_.set_default_verify_paths ();
    else
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);

    // SNI is set per connection on the stream, make sure no server name
    // callback left in the context gets in the way.
    //
    SSL_CTX_set_tlsext_servername_callback (ssl_ctx_.native_handle (),
                                            nullptr);
  }
}
