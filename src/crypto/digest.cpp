#include "crypto/digest.hpp"
#include "crypto/crypto_error.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace docxfer::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;


//==============================================
// HASHING
//==============================================

void Sha256::update(const char* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Hash already finalized");
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
}

std::string Sha256::hex_digest() {
  if (finalized_) {
    throw DigestError("Hash already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(hash[i]);
  }

  std::string result = ss.str();
  BOOST_LOG_TRIVIAL(debug) << "Digest: Generated hash: " << result;
  return result;
}

std::string Sha256::hex(const std::string& data) {
  Sha256 hasher;
  hasher.update(data);
  return hasher.hex_digest();
}

} // namespace docxfer::crypto
