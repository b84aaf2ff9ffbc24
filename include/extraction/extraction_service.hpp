#ifndef EXTRACTION_SERVICE_HPP_
#define EXTRACTION_SERVICE_HPP_

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace statement_recon {
namespace extraction {

/**
 * Raw uploaded document. `content` holds the exact bytes that are fingerprinted.
 */
struct UploadedFile {
  std::string filename;
  std::string content;
};

/**
 * External page extraction collaborator (OCR / language model).
 * Implementations may be called concurrently for different pages of a file.
 */
class ExtractionService {
 public:
  virtual ~ExtractionService() = default;

  virtual size_t pageCount(const UploadedFile& file) = 0;

  /**
   * Extraction payload of one page. Throws on failure or timeout; the caller
   * counts the page as failed.
   */
  virtual nlohmann::json extractPage(const UploadedFile& file, size_t page_index) = 0;
};

/**
 * Replays previously captured extraction output.
 *
 * Dump layout: {"files": {"<filename>": [page, ...]}}. A page is either the
 * JSON payload itself or the raw model reply text, possibly fenced.
 */
class RecordedExtractionService : public ExtractionService {
 public:
  // Throws std::invalid_argument when the dump does not have that layout.
  explicit RecordedExtractionService(const nlohmann::json& dump);

  size_t pageCount(const UploadedFile& file) override;
  nlohmann::json extractPage(const UploadedFile& file, size_t page_index) override;

 private:
  std::map<std::string, nlohmann::json> pages_;
};

}  // namespace extraction
}  // namespace statement_recon

#endif  // EXTRACTION_SERVICE_HPP_
