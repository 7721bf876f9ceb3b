#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/types/page.hpp"

namespace rag_core {

// Supplies the extracted text of a document, one entry per page.
class PageSource {
 public:
  virtual ~PageSource() = default;

  // Pages in document order.
  virtual std::vector<DocumentPage> load_pages() const = 0;

  // Human readable name of the document, used in stats and logs.
  virtual std::string describe() const = 0;
};

using PageSourcePtr = std::unique_ptr<PageSource>;

/**
 * @class TextPageSource
 * @brief Reads a plain-text dump of a PDF in which pages are separated by
 *        form feeds, the layout `pdftotext` writes.
 *
 * Page numbers follow the physical position of the page (1-based) even when
 * blank pages are skipped. Invalid UTF-8 is replaced rather than rejected.
 */
class TextPageSource : public PageSource {
 public:
  static constexpr char PAGE_SEPARATOR = '\f';

  explicit TextPageSource(std::filesystem::path file_path);

  // @throw UpstreamFailure if the file cannot be read.
  std::vector<DocumentPage> load_pages() const override;

  std::string describe() const override;

  // Splits already-loaded text into pages. Exposed for callers that hold text in memory.
  static std::vector<DocumentPage> split_pages(const std::string &content);

 private:
  std::string read_content() const;

  std::filesystem::path file_path_;
};

}  // namespace rag_core
