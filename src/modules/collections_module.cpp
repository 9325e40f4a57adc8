#include "curator/modules/collections_module.hpp"
#include "curator/command_registry.hpp"
#include "curator/input.hpp"
#include "shelf/catalog.hpp"
#include "shelf/library.hpp"

// pc pC ac am dc dm cC cs cc
void curator::modules::register_collections(curator::CommandRegistry& reg) {

  // print collection
  reg.add({
    "pc", "<name>  print a collection",
    [](curator::Context& ctx) {
      ctx.out << curator::read_collection(ctx) << "\n";
    }
  });

  reg.add({
    "pC", "print the catalog",
    [](curator::Context& ctx) {
      ctx.out << ctx.services.catalog << "\n";
    }
  });

  // add collection
  reg.add({
    "ac", "<name>  add an empty collection",
    [](curator::Context& ctx) {
      std::string name = shelf::read_word(ctx.in);
      ctx.services.catalog.add_collection(name);
      ctx.out << "Collection " << name << " added\n";
    }
  });

  // add member
  reg.add({
    "am", "<name> <id>  add a record to a collection",
    [](curator::Context& ctx) {
      shelf::Collection& collection = curator::read_collection(ctx);
      shelf::Record& record = curator::read_record_by_id(ctx);
      collection.add_member(record);
      ctx.out << "Member " << record.id() << " " << record.title() << " added\n";
    }
  });

  // delete collection
  reg.add({
    "dc", "<name>  delete a collection",
    [](curator::Context& ctx) {
      std::string name = shelf::read_word(ctx.in);
      ctx.services.catalog.delete_collection(name);
      ctx.out << "Collection " << name << " deleted\n";
    }
  });

  // delete member
  reg.add({
    "dm", "<name> <id>  remove a record from a collection",
    [](curator::Context& ctx) {
      shelf::Collection& collection = curator::read_collection(ctx);
      shelf::Record& record = curator::read_record_by_id(ctx);
      collection.delete_member(record);
      ctx.out << "Member " << record.id() << " " << record.title() << " deleted\n";
    }
  });

  // clear catalog
  reg.add({
    "cC", "delete all collections",
    [](curator::Context& ctx) {
      ctx.services.catalog.clear();
      ctx.out << "All collections deleted\n";
    }
  });

  // collection statistics
  reg.add({
    "cs", "membership statistics",
    [](curator::Context& ctx) {
      shelf::CollectionStats stats = ctx.services.catalog.collection_statistics();
      std::size_t num_records = ctx.services.library.size();
      ctx.out << stats.in_at_least_one << " out of " << num_records << " Records appear in at least one Collection\n"
              << stats.in_more_than_one << " out of " << num_records << " Records appear in more than one Collection\n"
              << "Collections contain a total of " << stats.total_memberships << " Records\n";
    }
  });

  // combine collections
  reg.add({
    "cc", "<first> <second> <new>  combine two collections into a new one",
    [](curator::Context& ctx) {
      std::string first = shelf::read_word(ctx.in);
      std::string second = shelf::read_word(ctx.in);
      std::string dst = shelf::read_word(ctx.in);
      ctx.services.catalog.combine_collections(first, second, dst);
      ctx.out << "Collections " << first << " and " << second << " combined into new collection " << dst << "\n";
    }
  });
}
