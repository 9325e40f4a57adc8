#include "shelf/collection.hpp"
#include "shelf/error.hpp"
#include "shelf/library.hpp"
#include "shelf/log.hpp"
#include "shelf/text_io.hpp"

#include <algorithm>
#include <sstream>

namespace shelf {

Collection::Collection(std::string name)
  : m_name(std::move(name)) {}

bool Collection::contains(int record_id) const {
  return m_members.contains(record_id);
}

void Collection::add_member(Record& record) {
  if (contains(record.id())) {
    throw Error(ErrorKind::AlreadyMember, "Record is already a member in the collection!", Recovery::DiscardLine);
  }
  m_members.emplace(record.id(), &record);
  record.m_membership_count++;
  log() << "[Collection] " << m_name << " += " << record.id() << " (" << record.m_membership_count << " collections)\n";
}

void Collection::delete_member(Record& record) {
  auto it = m_members.find(record.id());
  if (it == m_members.end()) {
    throw Error(ErrorKind::NotMember, "Record is not a member in the collection!", Recovery::DiscardLine);
  }
  m_members.erase(it);
  record.m_membership_count--;
  log() << "[Collection] " << m_name << " -= " << record.id() << " (" << record.m_membership_count << " collections)\n";
}

void Collection::merge(const Collection& other) {
  for (const auto& [id, record] : other.m_members) {
    if (m_members.emplace(id, record).second) {
      record->m_membership_count++;
    }
  }
}

void Collection::clear() {
  for (auto& [id, record] : m_members) {
    record->m_membership_count--;
  }
  m_members.clear();
}

std::vector<const Record*> Collection::sorted_members() const {
  std::vector<const Record*> members;
  members.reserve(m_members.size());
  for (const auto& [id, record] : m_members) {
    members.push_back(record);
  }
  std::sort(members.begin(), members.end(), [](const Record* a, const Record* b) {
    return a->title() < b->title();
  });
  return members;
}

void Collection::save(std::ostream& out) const {
  out << m_name << ' ' << m_members.size() << '\n';
  for (const Record* record : sorted_members()) {
    out << record->title() << '\n';
  }
}

Collection Collection::restore(std::istream& in, Library& library) {
  std::string name = read_word(in);
  if (name.empty()) throw_invalid_file();

  auto count = read_int(in);
  if (!count || *count < 0) throw_invalid_file();
  read_line(in); // rest of the header line

  Collection collection(std::move(name));
  for (int i = 0; i < *count; i++) {
    if (!in) throw_invalid_file();
    std::string title = read_line(in);

    Record* record = library.lookup_title(title);
    if (record == nullptr || collection.contains(record->id())) throw_invalid_file();

    collection.m_members.emplace(record->id(), record);
    record->m_membership_count++;
  }
  return collection;
}

std::ostream& operator<<(std::ostream& out, const Collection& collection) {
  out << "Collection " << collection.name() << " contains:";
  if (collection.empty()) {
    return out << " None";
  }
  return out << '\n' << format_records(collection.sorted_members());
}

std::string to_string(const Collection& collection) {
  std::ostringstream ss;
  ss << collection;
  return ss.str();
}

} // namespace shelf
