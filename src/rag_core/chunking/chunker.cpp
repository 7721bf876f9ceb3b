#include "rag_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <numeric>

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

std::string join_sentences(const std::vector<std::string> &sentences) {
  std::string joined;
  for (size_t i = 0; i < sentences.size(); ++i) {
    if (i > 0) {
      joined += ' ';
    }
    joined += sentences[i];
  }
  return joined;
}

bool is_terminal(char c) {
  return c == '.' || c == '!' || c == '?';
}

bool is_closing(char c) {
  return c == '"' || c == '\'' || c == ')' || c == ']';
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Length of the sentences joined by single spaces.
size_t joined_length(const std::vector<size_t> &lengths) {
  if (lengths.empty()) {
    return 0;
  }
  return std::accumulate(lengths.begin(), lengths.end(), size_t{0}) + lengths.size() - 1;
}

}  // namespace

Chunker::Chunker(int chunk_size, int overlap) : chunk_size_(chunk_size), overlap_(overlap) {
  if (chunk_size_ <= 0) {
    throw ConfigurationError("chunk_size must be greater than 0, got " +
                             std::to_string(chunk_size_));
  }
  if (overlap_ < 0) {
    throw ConfigurationError("overlap cannot be negative, got " + std::to_string(overlap_));
  }
  if (overlap_ >= chunk_size_) {
    throw ConfigurationError("overlap (" + std::to_string(overlap_) +
                             ") must be smaller than chunk_size (" +
                             std::to_string(chunk_size_) + ")");
  }
}

size_t Chunker::char_count(const std::string &text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::vector<std::string> Chunker::split_into_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  auto push_sentence = [&](size_t begin, size_t end) {
    std::string sentence = trim(text.substr(begin, end - begin));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
  };

  const size_t n = text.size();
  size_t sentence_start = 0;
  size_t i = 0;
  while (i < n) {
    if (is_terminal(text[i])) {
      size_t j = i;
      while (j < n && is_terminal(text[j])) ++j;
      while (j < n && is_closing(text[j])) ++j;
      if (j < n && is_space(text[j])) {
        // Punctuation stays with the sentence; the whitespace run is the separator.
        size_t next = j;
        while (next < n && is_space(text[next])) ++next;
        push_sentence(sentence_start, j);
        sentence_start = next;
        i = next;
      } else {
        i = j;
      }
    } else if (text[i] == '\n') {
      size_t next = i + 1;
      bool blank_line = false;
      while (next < n && is_space(text[next])) {
        if (text[next] == '\n') blank_line = true;
        ++next;
      }
      if (blank_line) {
        push_sentence(sentence_start, i);
        sentence_start = next;
      }
      i = next;
    } else {
      ++i;
    }
  }

  push_sentence(sentence_start, n);
  return sentences;
}

std::vector<Chunk> Chunker::create_chunks(const std::vector<DocumentPage> &pages) const {
  std::vector<Chunk> chunks;
  int next_chunk_index = 0;
  for (const auto &page : pages) {
    chunk_page(page, next_chunk_index, chunks);
  }
  return chunks;
}

void Chunker::chunk_page(const DocumentPage &page, int &next_chunk_index,
                         std::vector<Chunk> &out) const {
  std::string text = page.text;
  if (!utf8::is_valid(text.begin(), text.end())) {
    std::string repaired;
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
    text = std::move(repaired);
  }

  const std::vector<std::string> sentences = split_into_sentences(text);
  if (sentences.empty()) {
    return;
  }

  const size_t limit = static_cast<size_t>(chunk_size_);
  std::vector<std::string> current;
  std::vector<size_t> current_lengths;
  // Leading sentences of `current` carried over from the previous chunk.
  size_t seeded = 0;

  auto emit = [&]() {
    out.push_back({.text = join_sentences(current),
                   .page_number = page.page_number,
                   .chunk_index = next_chunk_index++});
  };

  for (const auto &sentence : sentences) {
    const size_t sentence_length = char_count(sentence);

    if (!current.empty() && joined_length(current_lengths) + 1 + sentence_length > limit) {
      if (current.size() > seeded) {
        emit();
        const size_t keep = std::min(static_cast<size_t>(overlap_), current.size());
        const auto drop = static_cast<std::ptrdiff_t>(current.size() - keep);
        current.erase(current.begin(), current.begin() + drop);
        current_lengths.erase(current_lengths.begin(), current_lengths.begin() + drop);
        seeded = keep;
      }
      // The carried-over sentences give way when they leave no room for the next one.
      while (!current.empty() && joined_length(current_lengths) + 1 + sentence_length > limit) {
        current.erase(current.begin());
        current_lengths.erase(current_lengths.begin());
        --seeded;
      }
    }

    current.push_back(sentence);
    current_lengths.push_back(sentence_length);
  }

  if (current.size() > seeded) {
    emit();
  }
}

std::vector<Chunk> create_chunks(const std::vector<DocumentPage> &pages, int chunk_size,
                                 int overlap) {
  return Chunker(chunk_size, overlap).create_chunks(pages);
}

}  // namespace rag_core
