#include "juggl/digest.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace juggl {

struct Sha256::Impl {
  EVP_MD_CTX* ctx{nullptr};
};

Sha256::Sha256() : p_(new Impl{}) {
  p_->ctx = EVP_MD_CTX_new();
  if (!p_->ctx || EVP_DigestInit_ex(p_->ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(p_->ctx);
    delete p_;
    throw std::runtime_error("EVP sha256 init failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(p_->ctx);
  delete p_;
}

void Sha256::update(std::string_view bytes) {
  if (bytes.empty()) return;
  if (EVP_DigestUpdate(p_->ctx, bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("EVP sha256 update failed");
  }
}

std::string Sha256::hex_final() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int n = 0;
  if (EVP_DigestFinal_ex(p_->ctx, md, &n) != 1) {
    throw std::runtime_error("EVP sha256 final failed");
  }
  std::ostringstream o;
  for (unsigned int i = 0; i < n; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

std::string sha256_hex(std::string_view bytes) {
  Sha256 h;
  h.update(bytes);
  return h.hex_final();
}

}
