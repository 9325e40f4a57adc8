#include "curator/input.hpp"
#include "shelf/error.hpp"
#include "shelf/text_io.hpp"

namespace curator {

std::string read_command(std::istream& in) {
  constexpr int kCommandLength = 2;

  std::string command;
  for (int i = 0; i < kCommandLength; i++) {
    shelf::skip_whitespace(in);
    int c = in.get();
    if (c == std::istream::traits_type::eof()) return {};
    command.push_back(static_cast<char>(c));
  }
  return command;
}

int read_int(std::istream& in) {
  auto value = shelf::read_int(in);
  if (!value) {
    throw shelf::Error(shelf::ErrorKind::BadInput, "Could not read an integer value!", shelf::Recovery::DiscardLine);
  }
  return *value;
}

std::string read_title(std::istream& in) {
  std::string title = shelf::normalize_title(shelf::read_line(in));
  if (title.empty()) {
    throw shelf::Error(shelf::ErrorKind::BadInput, "Could not read a title!", shelf::Recovery::KeepLine);
  }
  return title;
}

shelf::Record& read_record_by_id(Context& ctx) {
  int id = read_int(ctx.in);
  return ctx.services.library.find_record_by_id(id);
}

shelf::Record& read_record_by_title(Context& ctx) {
  std::string title = read_title(ctx.in);
  return ctx.services.library.find_record_by_title(title);
}

shelf::Collection& read_collection(Context& ctx) {
  std::string name = shelf::read_word(ctx.in);
  return ctx.services.catalog.find_collection(name);
}

} // namespace curator
