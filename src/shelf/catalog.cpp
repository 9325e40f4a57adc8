#include "shelf/catalog.hpp"
#include "shelf/error.hpp"
#include "shelf/library.hpp"
#include "shelf/log.hpp"
#include "shelf/text_io.hpp"

#include <sstream>
#include <unordered_map>

namespace shelf {

namespace {
  constexpr const char* kNoSuchCollection = "No collection with that name!";
  constexpr const char* kDuplicateCollection = "Catalog already has a collection with this name!";

  [[noreturn]] void throw_duplicate_collection() {
    throw Error(ErrorKind::Duplicate, kDuplicateCollection, Recovery::DiscardLine);
  }
}

void Catalog::add_collection(const std::string& name) {
  if (m_collections.contains(name)) throw_duplicate_collection();
  m_collections.emplace(name, Collection(name));
  log() << "[Catalog] Added collection " << name << "\n";
}

Collection& Catalog::find_collection(const std::string& name) {
  auto it = m_collections.find(name);
  if (it == m_collections.end()) {
    throw Error(ErrorKind::NotFound, kNoSuchCollection, Recovery::DiscardLine);
  }
  return it->second;
}

const Collection& Catalog::find_collection(const std::string& name) const {
  auto it = m_collections.find(name);
  if (it == m_collections.end()) {
    throw Error(ErrorKind::NotFound, kNoSuchCollection, Recovery::DiscardLine);
  }
  return it->second;
}

void Catalog::delete_collection(const std::string& name) {
  Collection& collection = find_collection(name);
  collection.clear();
  m_collections.erase(name);
  log() << "[Catalog] Deleted collection " << name << "\n";
}

void Catalog::clear() {
  for (auto& [name, collection] : m_collections) {
    collection.clear();
  }
  m_collections.clear();
  log() << "[Catalog] Cleared\n";
}

bool Catalog::has_members() const {
  for (const auto& [name, collection] : m_collections) {
    if (!collection.empty()) return true;
  }
  return false;
}

CollectionStats Catalog::collection_statistics() const {
  CollectionStats stats;
  std::unordered_map<int, int> occurrences; // record id -> collections holding it

  for (const auto& [name, collection] : m_collections) {
    stats.total_memberships += static_cast<int>(collection.size());
    for (const Record* record : collection.sorted_members()) {
      int seen = ++occurrences[record->id()];
      if (seen == 1) stats.in_at_least_one++;
      if (seen == 2) stats.in_more_than_one++;
    }
  }
  return stats;
}

void Catalog::combine_collections(const std::string& first, const std::string& second, const std::string& dst) {
  const Collection& first_src = find_collection(first);
  const Collection& second_src = find_collection(second);
  if (m_collections.contains(dst)) throw_duplicate_collection();

  Collection combined(dst);
  combined.merge(first_src);
  combined.merge(second_src);
  m_collections.emplace(dst, std::move(combined));
  log() << "[Catalog] Combined " << first << " and " << second << " into " << dst << "\n";
}

std::vector<const Collection*> Catalog::sorted_collections() const {
  std::vector<const Collection*> collections;
  collections.reserve(m_collections.size());
  for (const auto& [name, collection] : m_collections) {
    collections.push_back(&collection);
  }
  return collections;
}

void Catalog::save(std::ostream& out) const {
  out << m_collections.size() << '\n';
  for (const Collection* collection : sorted_collections()) {
    collection->save(out);
  }
}

Catalog Catalog::restore(std::istream& in, Library& library) {
  auto count = read_int(in);
  if (!count || *count < 0) throw_invalid_file();

  Catalog catalog;
  for (int i = 0; i < *count; i++) {
    Collection collection = Collection::restore(in, library);
    if (catalog.m_collections.contains(collection.name())) throw_invalid_file();
    std::string name = collection.name();
    catalog.m_collections.emplace(std::move(name), std::move(collection));
  }
  return catalog;
}

std::ostream& operator<<(std::ostream& out, const Catalog& catalog) {
  if (catalog.empty()) {
    return out << "Catalog is empty";
  }
  out << "Catalog contains " << catalog.size() << " collections:";
  for (const Collection* collection : catalog.sorted_collections()) {
    out << '\n' << *collection;
  }
  return out;
}

std::string to_string(const Catalog& catalog) {
  std::ostringstream ss;
  ss << catalog;
  return ss.str();
}

} // namespace shelf
