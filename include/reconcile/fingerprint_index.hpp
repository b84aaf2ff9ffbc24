#ifndef FINGERPRINT_INDEX_HPP_
#define FINGERPRINT_INDEX_HPP_

#include "statement_store.hpp"

#include <optional>
#include <string>

namespace statement_recon {
namespace reconcile {

/**
 * Exact-duplicate lookup by content fingerprint.
 */
class FingerprintIndex {
 public:
  explicit FingerprintIndex(StatementStore& store);

  /**
   * SHA-256 of the raw file content as 64 lowercase hex characters.
   * Throws std::runtime_error if the digest cannot be computed.
   */
  static std::string fingerprint(const std::string& content);

  /**
   * First stored statement whose fingerprint list contains `fingerprint`.
   * An empty fingerprint never matches.
   */
  std::optional<Statement> findDuplicate(const std::string& fingerprint);

 private:
  StatementStore& store_;
};

}  // namespace reconcile
}  // namespace statement_recon

#endif  // FINGERPRINT_INDEX_HPP_
