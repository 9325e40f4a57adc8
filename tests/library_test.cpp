#include <gtest/gtest.h>

#include <string>
#include <vector>
#include "shelf/catalog.hpp"
#include "shelf/error.hpp"
#include "shelf/library.hpp"

namespace {

std::vector<std::string> titles_of(const std::vector<const shelf::Record*>& records) {
  std::vector<std::string> titles;
  for (const shelf::Record* record : records) titles.push_back(record->title());
  return titles;
}

template <typename Fn>
shelf::Error catch_error(Fn&& fn) {
  try {
    fn();
  } catch (const shelf::Error& e) {
    return e;
  }
  ADD_FAILURE() << "expected shelf::Error";
  return shelf::Error(shelf::ErrorKind::IO, "no error thrown", shelf::Recovery::KeepLine);
}

TEST(LibraryTest, AddRecordAssignsSequentialIds) {
  shelf::Library library;
  EXPECT_EQ(library.add_record("DVD", "The Matrix"), 1);
  EXPECT_EQ(library.add_record("VHS", "Alien"), 2);
  EXPECT_EQ(library.add_record("CD", "Kind of Blue"), 3);

  EXPECT_EQ(library.size(), 3u);
  EXPECT_EQ(library.next_id(), 4);
  EXPECT_EQ(library.find_record_by_title("Alien").id(), 2);
  EXPECT_EQ(library.find_record_by_id(2).title(), "Alien");
  EXPECT_EQ(library.find_record_by_id(3).rating(), 0);
}

TEST(LibraryTest, DuplicateTitleIsRejected) {
  shelf::Library library;
  EXPECT_EQ(library.add_record("DVD", "The Matrix"), 1);

  shelf::Error e = catch_error([&] { library.add_record("VHS", "The Matrix"); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::Duplicate);
  EXPECT_STREQ(e.what(), "Library already has a record with this title!");
  EXPECT_FALSE(e.discards_line());

  EXPECT_EQ(library.next_id(), 2);
  EXPECT_EQ(library.size(), 1u);
  EXPECT_EQ(library.find_record_by_id(1).medium(), "DVD");
}

TEST(LibraryTest, LookupsReportMissingRecords) {
  shelf::Library library;
  library.add_record("DVD", "Alien");

  shelf::Error by_title = catch_error([&] { library.find_record_by_title("Aliens"); });
  EXPECT_EQ(by_title.kind(), shelf::ErrorKind::NotFound);
  EXPECT_STREQ(by_title.what(), "No record with that title!");
  EXPECT_FALSE(by_title.discards_line());

  shelf::Error by_id = catch_error([&] { library.find_record_by_id(2); });
  EXPECT_EQ(by_id.kind(), shelf::ErrorKind::NotFound);
  EXPECT_STREQ(by_id.what(), "No record with that ID!");
  EXPECT_TRUE(by_id.discards_line());

  EXPECT_EQ(library.lookup_title("Aliens"), nullptr);
  EXPECT_EQ(library.lookup_id(2), nullptr);
}

TEST(LibraryTest, DeleteRecordRemovesBothIndexes) {
  shelf::Library library;
  library.add_record("DVD", "Alien");
  library.add_record("DVD", "Brazil");

  shelf::Record removed = library.delete_record("Alien");
  EXPECT_EQ(removed.id(), 1);
  EXPECT_EQ(removed.title(), "Alien");
  EXPECT_EQ(library.size(), 1u);
  EXPECT_EQ(library.lookup_title("Alien"), nullptr);
  EXPECT_EQ(library.lookup_id(1), nullptr);

  // ids are never handed out twice
  EXPECT_EQ(library.add_record("VHS", "Alien"), 3);
}

TEST(LibraryTest, DeleteUnknownTitleIsRejected) {
  shelf::Library library;
  shelf::Error e = catch_error([&] { library.delete_record("Alien"); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::NotFound);
}

TEST(LibraryTest, DeleteRecordInCollectionIsRefused) {
  shelf::Library library;
  shelf::Catalog catalog;
  EXPECT_EQ(library.add_record("DVD", "The Matrix"), 1);
  catalog.add_collection("Favorites");
  catalog.find_collection("Favorites").add_member(library.find_record_by_id(1));

  shelf::Error e = catch_error([&] { library.delete_record("The Matrix"); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::InUse);
  EXPECT_STREQ(e.what(), "Cannot delete a record that is a member of a collection!");
  EXPECT_EQ(library.find_record_by_title("The Matrix").id(), 1);
  EXPECT_EQ(library.find_record_by_id(1).membership_count(), 1);

  catalog.find_collection("Favorites").delete_member(library.find_record_by_id(1));
  EXPECT_EQ(library.delete_record("The Matrix").id(), 1);
  EXPECT_TRUE(library.empty());
}

TEST(LibraryTest, ModifyTitleRekeysInPlace) {
  shelf::Library library;
  library.add_record("DVD", "Alien");
  shelf::Record& record = library.find_record_by_id(1);

  library.modify_title(record, "Aliens");
  EXPECT_EQ(record.id(), 1);
  EXPECT_EQ(record.title(), "Aliens");
  EXPECT_EQ(library.lookup_title("Alien"), nullptr);
  EXPECT_EQ(&library.find_record_by_title("Aliens"), &record);
  EXPECT_EQ(library.size(), 1u);
}

TEST(LibraryTest, ModifyTitleToTakenTitleIsRejected) {
  shelf::Library library;
  library.add_record("DVD", "Alien");
  library.add_record("DVD", "Brazil");
  shelf::Record& alien = library.find_record_by_id(1);

  shelf::Error e = catch_error([&] { library.modify_title(alien, "Brazil"); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::Duplicate);
  EXPECT_EQ(alien.title(), "Alien");
  EXPECT_EQ(library.find_record_by_title("Brazil").id(), 2);

  // renaming to its own title is a no-op
  library.modify_title(alien, "Alien");
  EXPECT_EQ(library.find_record_by_title("Alien").id(), 1);
}

TEST(LibraryTest, ClearIsRefusedWhileCollectionsHaveMembers) {
  shelf::Library library;
  shelf::Catalog catalog;
  library.add_record("DVD", "Alien");
  catalog.add_collection("Favs");
  catalog.find_collection("Favs").add_member(library.find_record_by_id(1));

  shelf::Error e = catch_error([&] { library.clear(catalog); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::InUse);
  EXPECT_STREQ(e.what(), "Cannot clear all records unless all collections are empty!");
  EXPECT_EQ(library.size(), 1u);
}

TEST(LibraryTest, ClearResetsIds) {
  shelf::Library library;
  shelf::Catalog catalog;
  library.add_record("DVD", "Alien");
  library.add_record("DVD", "Brazil");
  catalog.add_collection("Empty");

  library.clear(catalog);
  EXPECT_TRUE(library.empty());
  EXPECT_EQ(library.next_id(), 1);
  EXPECT_EQ(catalog.size(), 1u);
  EXPECT_EQ(library.add_record("VHS", "Alien"), 1);
}

TEST(LibraryTest, ClearAllEmptiesLibraryAndCatalog) {
  shelf::Library library;
  shelf::Catalog catalog;
  library.add_record("DVD", "Alien");
  catalog.add_collection("Favs");
  catalog.find_collection("Favs").add_member(library.find_record_by_id(1));

  library.clear_all(catalog);
  EXPECT_TRUE(library.empty());
  EXPECT_TRUE(catalog.empty());
  EXPECT_EQ(library.next_id(), 1);
}

TEST(LibraryTest, FindStringIsCaseInsensitiveAndSorted) {
  shelf::Library library;
  library.add_record("DVD", "The Matrix Reloaded");
  library.add_record("DVD", "Alien");
  library.add_record("DVD", "the matrix");

  auto matches = library.find_string("MATRIX");
  EXPECT_EQ(titles_of(matches), (std::vector<std::string>{"The Matrix Reloaded", "the matrix"}));
}

TEST(LibraryTest, FindStringFoldsNonAsciiCase) {
  shelf::Library library;
  library.add_record("DVD", "ÉCOLE DES FEMMES");
  library.add_record("DVD", "Ecole");
  library.add_record("CD", "Война и мир");

  EXPECT_EQ(titles_of(library.find_string("école")), (std::vector<std::string>{"ÉCOLE DES FEMMES"}));
  EXPECT_EQ(titles_of(library.find_string("ВОЙНА")), (std::vector<std::string>{"Война и мир"}));
}

TEST(LibraryTest, FindStringTreatsPatternCharactersLiterally) {
  shelf::Library library;
  library.add_record("DVD", "Alien");
  library.add_record("DVD", "What?.*");

  EXPECT_EQ(titles_of(library.find_string("?.*")), (std::vector<std::string>{"What?.*"}));

  shelf::Error e = catch_error([&] { library.find_string("a.i"); });
  EXPECT_EQ(e.kind(), shelf::ErrorKind::NotFound);
  EXPECT_STREQ(e.what(), "No records contain that string!");
}

TEST(LibraryTest, ListRatingsOrdersByRatingThenTitle) {
  shelf::Library library;
  library.add_record("DVD", "B");
  library.add_record("DVD", "A");
  library.add_record("DVD", "C");
  library.add_record("DVD", "D");
  library.find_record_by_title("B").set_rating(3);
  library.find_record_by_title("A").set_rating(5);
  library.find_record_by_title("C").set_rating(3);

  EXPECT_EQ(titles_of(library.list_ratings()), (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_TRUE(shelf::Library{}.list_ratings().empty());
}

TEST(LibraryTest, FormatsLibrary) {
  shelf::Library library;
  EXPECT_EQ(shelf::to_string(library), "Library is empty");

  library.add_record("VHS", "Brazil");
  library.add_record("DVD", "Alien");
  library.find_record_by_id(1).set_rating(2);
  EXPECT_EQ(shelf::to_string(library), "Library contains 2 records:\n2: DVD u Alien\n1: VHS 2 Brazil");
}

} // namespace
