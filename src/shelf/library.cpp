#include "shelf/library.hpp"
#include "shelf/catalog.hpp"
#include "shelf/error.hpp"
#include "shelf/log.hpp"
#include "shelf/text_io.hpp"

#include <algorithm>
#include <sstream>

namespace shelf {

namespace {
  constexpr const char* kNoSuchTitle = "No record with that title!";
  constexpr const char* kNoSuchId = "No record with that ID!";
  constexpr const char* kDuplicateTitle = "Library already has a record with this title!";

  [[noreturn]] void throw_no_such_title() {
    throw Error(ErrorKind::NotFound, kNoSuchTitle, Recovery::KeepLine);
  }

  [[noreturn]] void throw_no_such_id() {
    throw Error(ErrorKind::NotFound, kNoSuchId, Recovery::DiscardLine);
  }
}

int Library::add_record(std::string medium, std::string title) {
  if (m_by_title.contains(title)) {
    throw Error(ErrorKind::Duplicate, kDuplicateTitle, Recovery::KeepLine);
  }

  int id = m_next_id++;
  m_by_title.emplace(title, id);
  m_by_id.emplace(id, Record(std::move(medium), std::move(title), id));
  log() << "[Library] Added record " << id << " (" << m_by_id.at(id).title() << ")\n";
  return id;
}

Record* Library::lookup_title(const std::string& title) {
  auto it = m_by_title.find(title);
  if (it == m_by_title.end()) return nullptr;
  return &m_by_id.at(it->second);
}

Record* Library::lookup_id(int id) {
  auto it = m_by_id.find(id);
  if (it == m_by_id.end()) return nullptr;
  return &it->second;
}

Record& Library::find_record_by_title(const std::string& title) {
  Record* record = lookup_title(title);
  if (record == nullptr) throw_no_such_title();
  return *record;
}

const Record& Library::find_record_by_title(const std::string& title) const {
  auto it = m_by_title.find(title);
  if (it == m_by_title.end()) throw_no_such_title();
  return m_by_id.at(it->second);
}

Record& Library::find_record_by_id(int id) {
  Record* record = lookup_id(id);
  if (record == nullptr) throw_no_such_id();
  return *record;
}

const Record& Library::find_record_by_id(int id) const {
  auto it = m_by_id.find(id);
  if (it == m_by_id.end()) throw_no_such_id();
  return it->second;
}

Record Library::delete_record(const std::string& title) {
  auto title_it = m_by_title.find(title);
  if (title_it == m_by_title.end()) throw_no_such_title();

  auto id_it = m_by_id.find(title_it->second);
  if (id_it->second.membership_count() > 0) {
    throw Error(ErrorKind::InUse, "Cannot delete a record that is a member of a collection!", Recovery::KeepLine);
  }

  Record removed = std::move(id_it->second);
  m_by_title.erase(title_it);
  m_by_id.erase(id_it);
  log() << "[Library] Deleted record " << removed.id() << " (" << removed.title() << ")\n";
  return removed;
}

void Library::modify_title(Record& record, std::string new_title) {
  if (new_title == record.m_title) return;
  if (m_by_title.contains(new_title)) {
    throw Error(ErrorKind::Duplicate, kDuplicateTitle, Recovery::KeepLine);
  }

  auto node = m_by_title.extract(record.m_title);
  if (node.empty()) throw_no_such_title();
  node.key() = new_title;
  m_by_title.insert(std::move(node));

  log() << "[Library] Record " << record.id() << " renamed from " << record.m_title << " to " << new_title << "\n";
  record.m_title = std::move(new_title);
}

void Library::clear(const Catalog& catalog) {
  if (catalog.has_members()) {
    throw Error(ErrorKind::InUse, "Cannot clear all records unless all collections are empty!", Recovery::DiscardLine);
  }
  *this = Library{};
  log() << "[Library] Cleared\n";
}

void Library::clear_all(Catalog& catalog) {
  catalog.clear();
  *this = Library{};
  log() << "[Library] Cleared along with the catalog\n";
}

std::vector<const Record*> Library::find_string(std::string_view substr) const {
  const std::u32string pattern = fold_utf8(substr);

  std::vector<const Record*> matches;
  for (const Record* record : sorted_records()) {
    if (fold_utf8(record->title()).find(pattern) != std::u32string::npos) {
      matches.push_back(record);
    }
  }

  if (matches.empty()) {
    throw Error(ErrorKind::NotFound, "No records contain that string!", Recovery::DiscardLine);
  }
  return matches;
}

std::vector<const Record*> Library::list_ratings() const {
  std::vector<const Record*> records = sorted_records();
  std::stable_sort(records.begin(), records.end(), [](const Record* a, const Record* b) {
    return a->rating() > b->rating();
  });
  return records;
}

std::vector<const Record*> Library::sorted_records() const {
  std::vector<const Record*> records;
  records.reserve(m_by_title.size());
  for (const auto& [title, id] : m_by_title) {
    records.push_back(&m_by_id.at(id));
  }
  return records;
}

void Library::save(std::ostream& out) const {
  out << m_by_id.size() << '\n';
  for (const Record* record : sorted_records()) {
    record->save(out);
  }
}

Library Library::restore(std::istream& in) {
  auto count = read_int(in);
  if (!count || *count < 0) throw_invalid_file();

  Library library;
  int max_id = 0;
  for (int i = 0; i < *count; i++) {
    Record record = Record::restore(in);

    if (library.m_by_id.contains(record.id()) || library.m_by_title.contains(record.title())) {
      throw_invalid_file();
    }

    max_id = std::max(max_id, record.id());
    library.m_by_title.emplace(record.title(), record.id());
    library.m_by_id.emplace(record.id(), std::move(record));
  }

  library.m_next_id = max_id + 1;
  return library;
}

std::ostream& operator<<(std::ostream& out, const Library& library) {
  if (library.empty()) {
    return out << "Library is empty";
  }
  out << "Library contains " << library.size() << " records:\n";
  return out << format_records(library.sorted_records());
}

std::string to_string(const Library& library) {
  std::ostringstream ss;
  ss << library;
  return ss.str();
}

} // namespace shelf
