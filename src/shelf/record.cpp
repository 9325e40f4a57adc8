#include "shelf/record.hpp"
#include "shelf/error.hpp"
#include "shelf/text_io.hpp"

#include <sstream>

namespace shelf {

namespace {
  // the title is the rest of this line, so stop at the newline
  void skip_blanks(std::istream& in) {
    while (in.peek() == ' ' || in.peek() == '\t') in.get();
  }
}

Record::Record(std::string medium, std::string title, int id, int rating)
  : m_medium(std::move(medium)), m_title(std::move(title)), m_rating(rating), m_id(id) {}

void Record::set_rating(int rating) {
  if (rating < 1 || rating > 5) {
    throw Error(ErrorKind::Range, "Rating is out of range!", Recovery::DiscardLine);
  }
  m_rating = rating;
}

void Record::save(std::ostream& out) const {
  out << m_id << ' ' << m_medium << ' ' << m_rating << ' ' << m_title << '\n';
}

Record Record::restore(std::istream& in) {
  auto id = read_int(in);
  if (!id || *id < 1) throw_invalid_file();

  std::string medium = read_word(in);
  if (medium.empty()) throw_invalid_file();

  auto rating = read_int(in);
  if (!rating || *rating < 0 || *rating > 5) throw_invalid_file();

  skip_blanks(in);
  std::string title = read_line(in);
  if (title.empty()) throw_invalid_file();

  return Record(std::move(medium), std::move(title), *id, *rating);
}

std::ostream& operator<<(std::ostream& out, const Record& record) {
  out << record.id() << ": " << record.medium() << ' ';
  if (record.rating() == 0) {
    out << 'u';
  } else {
    out << record.rating();
  }
  return out << ' ' << record.title();
}

std::string to_string(const Record& record) {
  std::ostringstream ss;
  ss << record;
  return ss.str();
}

std::string format_records(const std::vector<const Record*>& records) {
  std::ostringstream ss;
  for (std::size_t i = 0; i < records.size(); i++) {
    if (i > 0) ss << '\n';
    ss << *records[i];
  }
  return ss.str();
}

} // namespace shelf
