#ifndef DOCXFER_CRYPTO_DIGEST_HPP
#define DOCXFER_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace docxfer::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over a byte stream
class Sha256 {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- HASHING ----
  void update(const char* data, std::size_t size);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finalizes and returns the lowercase hex digest. The hasher cannot be
  // updated afterwards.
  std::string hex_digest();

  // One-shot helper
  static std::string hex(const std::string& data);

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace docxfer::crypto

#endif // DOCXFER_CRYPTO_DIGEST_HPP
