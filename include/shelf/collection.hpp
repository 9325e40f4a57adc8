#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "shelf/record.hpp"

namespace shelf {

class Library;

// A named set of records. Members are not owned; every insert/erase keeps
// the record's membership count in step.
class Collection {
public:
  explicit Collection(std::string name);

  Collection(const Collection&) = delete;
  Collection& operator=(const Collection&) = delete;
  Collection(Collection&&) = default;
  Collection& operator=(Collection&&) = default;

  const std::string& name() const { return m_name; }
  std::size_t size() const { return m_members.size(); }
  bool empty() const { return m_members.empty(); }
  bool contains(int record_id) const;

  void add_member(Record& record);
  void delete_member(Record& record);

  // Adds every member of other that is not already here
  void merge(const Collection& other);

  // Drops every member, decrementing their membership counts
  void clear();

  // Ascending by title
  std::vector<const Record*> sorted_members() const;

  // "<name> <count>\n" then one title per line
  void save(std::ostream& out) const;

  // Titles are resolved against library, whose records get their counts bumped
  static Collection restore(std::istream& in, Library& library);

private:
  std::string m_name;
  std::map<int, Record*> m_members;
};

// "Collection <name> contains:" then members, or " None"
std::ostream& operator<<(std::ostream& out, const Collection& collection);
std::string to_string(const Collection& collection);

} // namespace shelf
