#include "curator/modules/storage_module.hpp"
#include "curator/command_registry.hpp"
#include "shelf/codec.hpp"

// sA rA cA pa
void curator::modules::register_storage(curator::CommandRegistry& reg) {

  // save all
  reg.add({
    "sA", "<file>  save everything to a file",
    [](curator::Context& ctx) {
      std::string filename = shelf::read_word(ctx.in);
      if (filename.empty()) {
        throw shelf::Error(shelf::ErrorKind::IO, "Could not open file!", shelf::Recovery::KeepLine);
      }
      shelf::save_file(filename, ctx.services.library, ctx.services.catalog);
      ctx.out << "Data saved\n";
    }
  });

  // restore all
  reg.add({
    "rA", "<file>  replace everything with a saved file",
    [](curator::Context& ctx) {
      std::string filename = shelf::read_word(ctx.in);
      if (filename.empty()) {
        throw shelf::Error(shelf::ErrorKind::IO, "Could not open file!", shelf::Recovery::KeepLine);
      }
      shelf::restore_file(filename, ctx.services.library, ctx.services.catalog);
      ctx.out << "Data loaded\n";
    }
  });

  // clear all
  reg.add({
    "cA", "delete all records and collections",
    [](curator::Context& ctx) {
      ctx.services.library.clear_all(ctx.services.catalog);
      ctx.out << "All data deleted\n";
    }
  });

  // print allocations
  reg.add({
    "pa", "print record and collection counts",
    [](curator::Context& ctx) {
      ctx.out << "Memory allocations:\n"
              << "Records: " << ctx.services.library.size() << "\n"
              << "Collections: " << ctx.services.catalog.size() << "\n";
    }
  });
}
