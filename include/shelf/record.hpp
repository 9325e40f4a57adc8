#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace shelf {

class Collection;
class Library;

// A single piece of media. Rating 0 means unrated.
class Record {
public:
  Record(std::string medium, std::string title, int id, int rating = 0);

  int id() const { return m_id; }
  const std::string& medium() const { return m_medium; }
  const std::string& title() const { return m_title; }
  int rating() const { return m_rating; }

  // Number of collections that currently hold this record
  int membership_count() const { return m_membership_count; }

  // Ratings set after creation are 1..5
  void set_rating(int rating);

  // "<id> <medium> <rating> <title>\n"
  void save(std::ostream& out) const;

  /**
   * @brief Reads one record line as written by save()
   *
   * @throw shelf::Error InvalidFormat on a bad id, medium, rating or title
   */
  static Record restore(std::istream& in);

private:
  friend class Collection;
  friend class Library;

  std::string m_medium;
  std::string m_title;
  int m_rating{0};
  int m_id{0};
  int m_membership_count{0};
};

// "<id>: <medium> <rating or u> <title>"
std::ostream& operator<<(std::ostream& out, const Record& record);
std::string to_string(const Record& record);

// One record per line, no trailing newline
std::string format_records(const std::vector<const Record*>& records);

} // namespace shelf
