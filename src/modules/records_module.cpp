#include "curator/modules/records_module.hpp"
#include "curator/command_registry.hpp"
#include "curator/input.hpp"
#include "shelf/library.hpp"

// fr pr pL ar mr mt dr cL fs lr
void curator::modules::register_records(curator::CommandRegistry& reg) {

  // find record by title
  reg.add({
    "fr", "<title>  print the record with that title",
    [](curator::Context& ctx) {
      ctx.out << curator::read_record_by_title(ctx) << "\n";
    }
  });

  // print record by id
  reg.add({
    "pr", "<id>  print the record with that id",
    [](curator::Context& ctx) {
      ctx.out << curator::read_record_by_id(ctx) << "\n";
    }
  });

  reg.add({
    "pL", "print the library",
    [](curator::Context& ctx) {
      ctx.out << ctx.services.library << "\n";
    }
  });

  // add record
  reg.add({
    "ar", "<medium> <title>  add a record",
    [](curator::Context& ctx) {
      std::string medium = shelf::read_word(ctx.in);
      std::string title = curator::read_title(ctx.in);
      int id = ctx.services.library.add_record(std::move(medium), std::move(title));
      ctx.out << "Record " << id << " added\n";
    }
  });

  // modify rating
  reg.add({
    "mr", "<id> <rating>  rate a record 1-5",
    [](curator::Context& ctx) {
      shelf::Record& record = curator::read_record_by_id(ctx);
      int rating = curator::read_int(ctx.in);
      record.set_rating(rating);
      ctx.out << "Rating for record " << record.id() << " changed to " << rating << "\n";
    }
  });

  // modify title
  reg.add({
    "mt", "<id> <title>  retitle a record",
    [](curator::Context& ctx) {
      shelf::Record& record = curator::read_record_by_id(ctx);
      std::string title = curator::read_title(ctx.in);
      ctx.services.library.modify_title(record, title);
      ctx.out << "Title for record " << record.id() << " changed to " << title << "\n";
    }
  });

  // delete record
  reg.add({
    "dr", "<title>  delete a record that is in no collection",
    [](curator::Context& ctx) {
      std::string title = curator::read_title(ctx.in);
      shelf::Record removed = ctx.services.library.delete_record(title);
      ctx.out << "Record " << removed.id() << " " << removed.title() << " deleted\n";
    }
  });

  // clear library
  reg.add({
    "cL", "delete all records (collections must be empty)",
    [](curator::Context& ctx) {
      ctx.services.library.clear(ctx.services.catalog);
      ctx.out << "All records deleted\n";
    }
  });

  // find string
  reg.add({
    "fs", "<text>  list records whose title contains text",
    [](curator::Context& ctx) {
      std::string substr = shelf::read_word(ctx.in);
      ctx.out << shelf::format_records(ctx.services.library.find_string(substr)) << "\n";
    }
  });

  // list ratings
  reg.add({
    "lr", "list records by rating",
    [](curator::Context& ctx) {
      if (ctx.services.library.empty()) {
        ctx.out << "Library is empty\n";
        return;
      }
      ctx.out << shelf::format_records(ctx.services.library.list_ratings()) << "\n";
    }
  });
}
