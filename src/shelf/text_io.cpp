#include "shelf/text_io.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <locale>
#include <stdexcept>
#include "shelf/log.hpp"

namespace shelf {

namespace {
  bool is_space(int c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  }

  bool is_digit(int c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  }

  constexpr char32_t kReplacement = 0xFFFD;

  // Decodes the code point at text[pos] into cp and returns its length in
  // bytes. A malformed sequence decodes as U+FFFD, one byte at a time.
  std::size_t decode_at(std::string_view text, std::size_t pos, char32_t& cp) {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char lead = byte(pos);
    if (lead < 0x80) {
      cp = lead;
      return 1;
    }

    std::size_t len = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) {
      len = 2; min = 0x80; cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3; min = 0x800; cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4; min = 0x10000; cp = lead & 0x07;
    } else {
      cp = kReplacement;
      return 1;
    }

    if (pos + len > text.size()) {
      cp = kReplacement;
      return 1;
    }
    for (std::size_t i = 1; i < len; i++) {
      unsigned char b = byte(pos + i);
      if ((b & 0xC0) != 0x80) {
        cp = kReplacement;
        return 1;
      }
      cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      cp = kReplacement;
      return 1;
    }
    return len;
  }

  // White_Space code points, as title separators
  bool is_unicode_space(char32_t cp) {
    switch (cp) {
      case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
      case 0x0085: case 0x00A0: case 0x1680:
      case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
      default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
  }

  const std::locale& unicode_locale() {
    static const std::locale loc = [] {
      for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
        try {
          return std::locale(name);
        } catch (const std::runtime_error&) {
          log() << "[TextIo] Locale " << name << " not available\n";
        }
      }
      log() << "[TextIo] No UTF-8 locale, case folding is ASCII only\n";
      return std::locale::classic();
    }();
    return loc;
  }

  char32_t fold_case(char32_t cp) {
    if (cp < 0x80) {
      return static_cast<char32_t>(std::tolower(static_cast<int>(cp)));
    }
    static const auto& ctype = std::use_facet<std::ctype<wchar_t>>(unicode_locale());
    return static_cast<char32_t>(ctype.tolower(static_cast<wchar_t>(cp)));
  }
}

void skip_whitespace(std::istream& in) {
  while (true) {
    int c = in.peek();
    if (c == std::istream::traits_type::eof() || !is_space(c)) return;
    in.get();
  }
}

std::string read_word(std::istream& in) {
  skip_whitespace(in);

  std::string word;
  while (true) {
    int c = in.peek();
    if (c == std::istream::traits_type::eof() || is_space(c)) break;
    word.push_back(static_cast<char>(in.get()));
  }
  return word;
}

std::optional<int> read_int(std::istream& in) {
  skip_whitespace(in);

  int c = in.peek();
  if (c == std::istream::traits_type::eof()) return std::nullopt;
  if (c != '+' && c != '-' && !is_digit(c)) return std::nullopt;

  std::string digits;
  digits.push_back(static_cast<char>(in.get()));
  while (is_digit(in.peek())) {
    digits.push_back(static_cast<char>(in.get()));
  }

  // from_chars takes '-' but not '+'
  std::string_view text(digits);
  if (text.front() == '+') text.remove_prefix(1);
  if (text.empty() || text == "-") return std::nullopt;

  int value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
  return value;
}

std::string read_line(std::istream& in) {
  std::string line;
  std::getline(in, line);
  return line;
}

std::string normalize_title(std::string_view text) {
  std::string title;
  std::size_t word_start = 0;
  bool in_word = false;

  auto end_word = [&](std::size_t end) {
    if (!title.empty()) title.push_back(' ');
    title.append(text.substr(word_start, end - word_start));
    in_word = false;
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    std::size_t len = decode_at(text, pos, cp);
    if (is_unicode_space(cp)) {
      if (in_word) end_word(pos);
    } else if (!in_word) {
      word_start = pos;
      in_word = true;
    }
    pos += len;
  }
  if (in_word) end_word(text.size());
  return title;
}

std::u32string fold_utf8(std::string_view text) {
  std::u32string folded;
  folded.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    pos += decode_at(text, pos, cp);
    folded.push_back(fold_case(cp));
  }
  return folded;
}

} // namespace shelf
