#pragma once

#include <filesystem>
#include <istream>
#include <ostream>
#include "shelf/catalog.hpp"
#include "shelf/library.hpp"

namespace shelf {

// Library block followed by catalog block.
// @throw shelf::Error IO if the stream goes bad while writing
void save(std::ostream& out, const Library& library, const Catalog& catalog);

/**
 * @brief Replaces library and catalog with what the stream holds
 *
 * Both targets are left as they were unless the whole stream parses.
 * @throw shelf::Error InvalidFormat on malformed data
 */
void restore(std::istream& in, Library& library, Catalog& catalog);

// Writes <path>.tmp then renames it over path
void save_file(const std::filesystem::path& path, const Library& library, const Catalog& catalog);

void restore_file(const std::filesystem::path& path, Library& library, Catalog& catalog);

} // namespace shelf
