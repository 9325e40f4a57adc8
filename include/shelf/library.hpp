#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "shelf/record.hpp"

namespace shelf {

class Catalog;

// Owns every Record. Records live in a table keyed by id; titles are a
// secondary index onto the same entries. Ids are never reused.
class Library {
public:
  Library() = default;

  Library(const Library&) = delete;
  Library& operator=(const Library&) = delete;
  Library(Library&&) = default;
  Library& operator=(Library&&) = default;

  // Returns the id given to the new record
  int add_record(std::string medium, std::string title);

  Record& find_record_by_title(const std::string& title);
  const Record& find_record_by_title(const std::string& title) const;
  Record& find_record_by_id(int id);
  const Record& find_record_by_id(int id) const;

  // nullptr when absent
  Record* lookup_title(const std::string& title);
  Record* lookup_id(int id);

  // Refused while the record belongs to any collection
  Record delete_record(const std::string& title);

  void modify_title(Record& record, std::string new_title);

  // Refused while any collection in catalog has members
  void clear(const Catalog& catalog);

  // Empties catalog (releasing memberships first), then this library
  void clear_all(Catalog& catalog);

  // Case-insensitive literal substring match on titles, ascending by title
  std::vector<const Record*> find_string(std::string_view substr) const;

  // Rating descending, then title ascending
  std::vector<const Record*> list_ratings() const;

  // Ascending by title
  std::vector<const Record*> sorted_records() const;

  std::size_t size() const { return m_by_id.size(); }
  bool empty() const { return m_by_id.empty(); }
  int next_id() const { return m_next_id; }

  void save(std::ostream& out) const;

  /**
   * @brief Reads a record count followed by that many record lines
   *
   * next_id() of the result is one past the largest id read.
   * @throw shelf::Error InvalidFormat on a bad count, a bad line or a repeated id/title
   */
  static Library restore(std::istream& in);

private:
  std::map<int, Record> m_by_id;
  std::map<std::string, int> m_by_title;
  int m_next_id{1};
};

// "Library is empty" or "Library contains <n> records:" then each record
std::ostream& operator<<(std::ostream& out, const Library& library);
std::string to_string(const Library& library);

} // namespace shelf
