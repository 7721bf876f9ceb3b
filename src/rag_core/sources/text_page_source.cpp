#include "rag_core/sources/page_source.hpp"

#include <utf8.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

std::string trim(const std::string &s) {
  const char *whitespace = " \t\n\r\f\v";
  const auto begin = s.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

TextPageSource::TextPageSource(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::string TextPageSource::describe() const {
  return file_path_.string();
}

std::string TextPageSource::read_content() const {
  std::ifstream file_stream(file_path_, std::ios::binary);
  if (!file_stream.is_open()) {
    throw UpstreamFailure("Could not open page text file: " + file_path_.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::vector<DocumentPage> TextPageSource::load_pages() const {
  return split_pages(read_content());
}

std::vector<DocumentPage> TextPageSource::split_pages(const std::string &content) {
  std::string text;
  if (utf8::is_valid(content.begin(), content.end())) {
    text = content;
  } else {
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(text));
  }

  std::vector<DocumentPage> pages;
  int page_number = 1;
  size_t page_start = 0;
  while (page_start <= text.size()) {
    size_t page_end = text.find(PAGE_SEPARATOR, page_start);
    if (page_end == std::string::npos) {
      page_end = text.size();
    }

    std::string page_text = trim(text.substr(page_start, page_end - page_start));
    if (!page_text.empty()) {
      pages.push_back({.text = std::move(page_text), .page_number = page_number});
    }

    ++page_number;
    page_start = page_end + 1;
  }
  return pages;
}

}  // namespace rag_core
