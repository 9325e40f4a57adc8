#include "shelf/codec.hpp"
#include "shelf/error.hpp"
#include "shelf/log.hpp"

#include <fstream>
#include <system_error>

namespace shelf {

namespace {
  constexpr const char* kUnopenableFile = "Could not open file!";
  constexpr const char* kUnwritableFile = "Could not write file!";

  [[noreturn]] void throw_io(const char* message) {
    throw Error(ErrorKind::IO, message, Recovery::DiscardLine);
  }
}

void save(std::ostream& out, const Library& library, const Catalog& catalog) {
  library.save(out);
  catalog.save(out);
  out.flush();
  if (!out) throw_io(kUnwritableFile);
}

void restore(std::istream& in, Library& library, Catalog& catalog) {
  Library restored_library = Library::restore(in);
  Catalog restored_catalog = Catalog::restore(in, restored_library);

  // catalog first: the old one points into the old library's records
  catalog = std::move(restored_catalog);
  library = std::move(restored_library);
}

void save_file(const std::filesystem::path& path, const Library& library, const Catalog& catalog) {
  auto tmp = path;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) throw_io(kUnopenableFile);
    try {
      save(out, library, catalog);
    } catch (const Error&) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  std::error_code type_ec;
  if (ec && std::filesystem::is_regular_file(path, type_ec)) {
    // some platforms refuse to rename over an existing file; move the old
    // one aside and put it back if the second attempt fails too
    auto backup = path;
    backup += ".bak";
    std::error_code aside_ec;
    std::filesystem::rename(path, backup, aside_ec);
    if (!aside_ec) {
      std::filesystem::rename(tmp, path, ec);
      std::error_code restore_ec;
      if (ec) {
        std::filesystem::rename(backup, path, restore_ec);
      } else {
        std::filesystem::remove(backup, restore_ec);
      }
      if (restore_ec) {
        log() << "[Codec] Could not clean up " << backup << ": " << restore_ec.message() << "\n";
      }
    }
  }
  if (ec) {
    log() << "[Codec] Could not move " << tmp << " to " << path << ": " << ec.message() << "\n";
    std::error_code remove_ec;
    std::filesystem::remove(tmp, remove_ec);
    throw_io(kUnwritableFile);
  }

  log() << "[Codec] Saved " << library.size() << " records and " << catalog.size() << " collections to " << path << "\n";
}

void restore_file(const std::filesystem::path& path, Library& library, Catalog& catalog) {
  std::ifstream in(path);
  if (!in) throw_io(kUnopenableFile);

  restore(in, library, catalog);
  log() << "[Codec] Restored " << library.size() << " records and " << catalog.size() << " collections from " << path << "\n";
}

} // namespace shelf
