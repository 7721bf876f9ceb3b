#pragma once

#include <string>

namespace rag_core {

// One page of extracted document text. page_number is 1-based.
struct DocumentPage {
  std::string text;
  int page_number;
};

}  // namespace rag_core
