#include "extraction/extraction_service.hpp"
#include "extraction/page_extraction.hpp"

#include <stdexcept>

namespace statement_recon {
namespace extraction {

RecordedExtractionService::RecordedExtractionService(const nlohmann::json& dump) {
  auto files = dump.find("files");
  if (files == dump.end() || !files->is_object()) {
    throw std::invalid_argument("extraction dump has no 'files' object");
  }

  for (auto it = files->begin(); it != files->end(); ++it) {
    if (!it.value().is_array()) {
      throw std::invalid_argument("pages of '" + it.key() + "' are not an array");
    }
    pages_[it.key()] = it.value();
  }
}

size_t RecordedExtractionService::pageCount(const UploadedFile& file) {
  auto it = pages_.find(file.filename);
  return it == pages_.end() ? 0 : it->second.size();
}

nlohmann::json RecordedExtractionService::extractPage(const UploadedFile& file, size_t page_index) {
  auto it = pages_.find(file.filename);
  if (it == pages_.end() || page_index >= it->second.size()) {
    throw std::out_of_range("no recorded page " + std::to_string(page_index) + " for " +
                            file.filename);
  }

  const nlohmann::json& page = it->second[page_index];
  if (page.is_string()) {
    return parseModelResponse(page.get<std::string>());
  }
  return page;
}

}  // namespace extraction
}  // namespace statement_recon
