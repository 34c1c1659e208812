#pragma once
#include <string>
#include <string_view>

namespace juggl {

// Incremental SHA-256 of the emitted stream (OpenSSL EVP).
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(std::string_view bytes);
  std::string hex_final();   // lowercase hex; the object is spent afterwards

private:
  struct Impl; Impl* p_;
};

std::string sha256_hex(std::string_view bytes);

}
