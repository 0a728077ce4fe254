#include "tls_identity.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "utils.hpp"

namespace {

struct BioFree { void operator()(BIO* b) const { BIO_free(b); } };
struct PkeyFree { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };
struct X509Free { void operator()(X509* x) const { X509_free(x); } };

using BioPtr = std::unique_ptr<BIO, BioFree>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree>;
using X509Ptr = std::unique_ptr<X509, X509Free>;

[[noreturn]] void throw_openssl(const std::string& what) {
  unsigned long code = ERR_get_error();
  char buf[256] = {0};
  if(code != 0) ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  throw std::runtime_error(what + (code != 0 ? std::string(": ") + buf : std::string()));
}

std::string bio_to_string(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  return std::string(data, data + (len > 0 ? len : 0));
}

std::string fingerprint_of(X509* cert) {
  int len = i2d_X509(cert, nullptr);
  if(len <= 0) throw_openssl("i2d_X509 failed");
  std::string der(static_cast<std::size_t>(len), '\0');
  auto* out = reinterpret_cast<unsigned char*>(&der[0]);
  if(i2d_X509(cert, &out) != len) throw_openssl("i2d_X509 failed");
  return sha256_hex(der);
}

X509Ptr read_certificate(const std::string& pem) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if(!bio) throw_openssl("BIO_new_mem_buf failed");
  X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if(!cert) throw_openssl("certificate PEM is invalid");
  return cert;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw std::runtime_error("cannot read " + path.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

} // namespace

TlsIdentity::TlsIdentity(std::string certificate_pem, std::string private_key_pem, std::string fingerprint)
  : certificate_pem_(std::move(certificate_pem)),
    private_key_pem_(std::move(private_key_pem)),
    fingerprint_(std::move(fingerprint)) {}

TlsIdentity TlsIdentity::generate(const std::string& common_name) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if(!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
     EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) <= 0) {
    throw_openssl("RSA key setup failed");
  }
  EVP_PKEY* raw_key = nullptr;
  if(EVP_PKEY_keygen(ctx.get(), &raw_key) <= 0) throw_openssl("RSA key generation failed");
  PkeyPtr key(raw_key);

  X509Ptr cert(X509_new());
  if(!cert) throw_openssl("X509_new failed");
  X509_set_version(cert.get(), 2);
  const auto serial = random_hex(8);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()),
                   static_cast<long>(std::stoul(serial.substr(0, 7), nullptr, 16)));
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * 365 * 10);
  X509_set_pubkey(cert.get(), key.get());

  X509_NAME* name = X509_get_subject_name(cert.get());
  const std::string cn = common_name.empty() ? "localshare" : common_name;
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                             reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
  X509_set_issuer_name(cert.get(), name);
  if(X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) throw_openssl("X509_sign failed");

  BioPtr cert_bio(BIO_new(BIO_s_mem()));
  BioPtr key_bio(BIO_new(BIO_s_mem()));
  if(!cert_bio || !key_bio) throw_openssl("BIO_new failed");
  if(PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) throw_openssl("PEM_write_bio_X509 failed");
  if(PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw_openssl("PEM_write_bio_PrivateKey failed");
  }
  return TlsIdentity(bio_to_string(cert_bio.get()),
                     bio_to_string(key_bio.get()),
                     fingerprint_of(cert.get()));
}

TlsIdentity TlsIdentity::from_pem(std::string certificate_pem, std::string private_key_pem) {
  auto cert = read_certificate(certificate_pem);
  auto fingerprint = fingerprint_of(cert.get());
  return TlsIdentity(std::move(certificate_pem), std::move(private_key_pem), std::move(fingerprint));
}

TlsIdentity TlsIdentity::load_or_create(const std::filesystem::path& dir,
                                        const std::string& common_name) {
  const auto cert_path = dir / "cert.pem";
  const auto key_path = dir / "key.pem";
  std::error_code ec;
  const bool have_cert = std::filesystem::exists(cert_path, ec);
  const bool have_key = std::filesystem::exists(key_path, ec);
  if(have_cert && have_key) {
    return from_pem(read_file(cert_path), read_file(key_path));
  }
  if(have_cert != have_key) {
    throw std::runtime_error("identity in " + dir.string() + " is incomplete (need cert.pem and key.pem)");
  }
  auto identity = generate(common_name);
  std::string error;
  if(!identity.save(dir, error)) {
    throw std::runtime_error(error);
  }
  return identity;
}

bool TlsIdentity::save(const std::filesystem::path& dir, std::string& error) const {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if(ec) {
    error = "cannot create " + dir.string() + ": " + ec.message();
    return false;
  }
  std::ofstream cert(dir / "cert.pem", std::ios::binary | std::ios::trunc);
  std::ofstream key(dir / "key.pem", std::ios::binary | std::ios::trunc);
  if(!cert || !key) {
    error = "cannot write identity files in " + dir.string();
    return false;
  }
  cert << certificate_pem_;
  key << private_key_pem_;
  key.close();
  std::filesystem::permissions(dir / "key.pem",
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  return static_cast<bool>(cert);
}

void TlsIdentity::apply_to(asio::ssl::context& context) const {
  context.use_certificate_chain(asio::buffer(certificate_pem_));
  context.use_private_key(asio::buffer(private_key_pem_), asio::ssl::context::pem);
}
