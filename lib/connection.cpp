/* MIT License
 *
 * Copyright (c) 2024 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "connection.hpp"

#include "logger.hpp"

#include <boost/beast/core/stream_traits.hpp>  // for get_lowest_layer

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace vnr {

connection::connection(boost::asio::io_context &ioc, const std::string &origin,
                       const std::uint32_t id) :
  id{id}, origin{origin}, stream{std::in_place_type<plain_stream>, ioc} {}

connection::connection(boost::asio::io_context &ioc,
                       boost::asio::ssl::context &ssl_ctx,
                       const std::string &origin, const std::uint32_t id) :
  id{id}, origin{origin},
  stream{std::in_place_type<tls_stream>, ioc, ssl_ctx} {}

auto
connection::lowest_layer() -> boost::beast::tcp_stream & {
  return std::visit(
    [](auto &s) -> boost::beast::tcp_stream & {
      return boost::beast::get_lowest_layer(s);
    },
    stream);
}

auto
connection::tls_handle() -> SSL * {
  if (auto s = std::get_if<tls_stream>(&stream))
    return s->native_handle();
  return nullptr;
}

auto
connection::close() -> void {
  lowest_layer().close();
}

[[nodiscard]] auto
describe_certificate(X509 *cert) -> std::string {
  static constexpr auto name_size = 512;
  if (cert == nullptr)
    return "(no certificate)";

  std::array<char, name_size> subject{};
  std::array<char, name_size> issuer{};
  X509_NAME_oneline(X509_get_subject_name(cert), subject.data(), name_size);
  X509_NAME_oneline(X509_get_issuer_name(cert), issuer.data(), name_size);

  std::string not_after;
  const std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                      &BIO_free);
  if (bio && ASN1_TIME_print(bio.get(), X509_get0_notAfter(cert)) == 1) {
    char *data{};
    const auto n = BIO_get_mem_data(bio.get(), &data);
    if (n > 0)
      not_after.assign(data, static_cast<std::size_t>(n));
  }
  return fmt::format("subject={} issuer={} not_after={}", subject.data(),
                     issuer.data(), not_after);
}

auto
log_tls_details(SSL *ssl) -> void {
  auto &lgr = logger::instance();
  if (ssl == nullptr)
    return;

  lgr.debug("TLS protocol: {}", SSL_get_version(ssl));
  lgr.debug("TLS cipher: {}", SSL_CIPHER_get_name(SSL_get_current_cipher(ssl)));
  lgr.debug("TLS session resumed: {}", SSL_session_reused(ssl) == 1);

  const unsigned char *alpn{};
  unsigned int alpn_size{};
  SSL_get0_alpn_selected(ssl, &alpn, &alpn_size);
  if (alpn_size > 0)
    lgr.debug("TLS ALPN: {}",
              std::string(reinterpret_cast<const char *>(alpn), alpn_size));

  const auto verify_result = SSL_get_verify_result(ssl);
  lgr.debug("TLS verify result: {} ({})", verify_result,
            X509_verify_cert_error_string(verify_result));

  // the client side chain includes the peer certificate
  const auto chain = SSL_get_peer_cert_chain(ssl);
  if (chain == nullptr) {
    lgr.warning("TLS peer sent no certificate chain");
    return;
  }
  const auto n_certs = sk_X509_num(chain);
  lgr.debug("TLS peer certificate chain length: {}", n_certs);
  for (auto i = 0; i < n_certs; ++i)
    lgr.debug("TLS peer certificate [{}]: {}", i,
              describe_certificate(sk_X509_value(chain, i)));
}

}  // namespace vnr
