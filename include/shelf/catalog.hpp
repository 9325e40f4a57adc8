#pragma once

#include <cstddef>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "shelf/collection.hpp"

namespace shelf {

class Library;

struct CollectionStats {
  int in_at_least_one{0};
  int in_more_than_one{0};
  int total_memberships{0};
};

// Collections by unique name
class Catalog {
public:
  Catalog() = default;

  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;
  Catalog(Catalog&&) = default;
  Catalog& operator=(Catalog&&) = default;

  void add_collection(const std::string& name);

  Collection& find_collection(const std::string& name);
  const Collection& find_collection(const std::string& name) const;

  // Releases the members before the collection goes away; never blocked
  void delete_collection(const std::string& name);

  void clear();

  // True if any collection has at least one member
  bool has_members() const;

  CollectionStats collection_statistics() const;

  // dst becomes the set union of first and second; the sources are untouched
  void combine_collections(const std::string& first, const std::string& second, const std::string& dst);

  std::size_t size() const { return m_collections.size(); }
  bool empty() const { return m_collections.empty(); }

  // Ascending by name
  std::vector<const Collection*> sorted_collections() const;

  void save(std::ostream& out) const;

  /**
   * @brief Reads a collection count followed by that many collection blocks
   *
   * @param library already restored; member titles are resolved against it
   * @throw shelf::Error InvalidFormat on a bad count, a bad block or a repeated name
   */
  static Catalog restore(std::istream& in, Library& library);

private:
  std::map<std::string, Collection> m_collections;
};

// "Catalog is empty" or "Catalog contains <n> collections:" then each collection
std::ostream& operator<<(std::ostream& out, const Catalog& catalog);
std::string to_string(const Catalog& catalog);

} // namespace shelf
