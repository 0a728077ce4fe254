#pragma once
#include <asio/ssl.hpp>

#include <filesystem>
#include <string>

// Self-signed certificate plus key. LocalSend peers identify each other by the
// SHA-256 of the certificate, there is no certificate authority.
class TlsIdentity {
public:
  // Fresh RSA-2048 key and a ten year certificate for `common_name`. Throws on failure.
  static TlsIdentity generate(const std::string& common_name);

  // Loads cert.pem/key.pem from `dir`, creating and saving a new identity when
  // neither exists. Throws when the files exist but cannot be used.
  static TlsIdentity load_or_create(const std::filesystem::path& dir,
                                    const std::string& common_name);

  static TlsIdentity from_pem(std::string certificate_pem, std::string private_key_pem);

  bool save(const std::filesystem::path& dir, std::string& error) const;

  // Installs certificate and key into a server context.
  void apply_to(asio::ssl::context& context) const;

  const std::string& certificate_pem() const { return certificate_pem_; }
  const std::string& private_key_pem() const { return private_key_pem_; }
  const std::string& fingerprint() const { return fingerprint_; }

private:
  TlsIdentity(std::string certificate_pem, std::string private_key_pem, std::string fingerprint);

  std::string certificate_pem_;
  std::string private_key_pem_;
  std::string fingerprint_;
};
