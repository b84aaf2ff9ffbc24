#include "reconcile/fingerprint_index.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace statement_recon {
namespace reconcile {

FingerprintIndex::FingerprintIndex(StatementStore& store)
    : store_(store) {
}

std::string FingerprintIndex::fingerprint(const std::string& content) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, content.data(), content.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
  }
  EVP_MD_CTX_free(ctx);

  static const char* const kHex = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0f]);
  }
  return hex;
}

std::optional<Statement> FingerprintIndex::findDuplicate(const std::string& fingerprint) {
  if (fingerprint.empty()) return std::nullopt;

  for (auto& statement : store_.statementsWithFingerprints()) {
    const auto& fps = statement.fingerprints;
    if (std::find(fps.begin(), fps.end(), fingerprint) != fps.end()) {
      return statement;
    }
  }
  return std::nullopt;
}

}  // namespace reconcile
}  // namespace statement_recon
