#pragma once

#include <istream>
#include <string>
#include "curator/context.hpp"
#include "shelf/collection.hpp"
#include "shelf/record.hpp"

namespace curator {

// Two non-whitespace characters; empty at end of input
std::string read_command(std::istream& in);

// @throw shelf::Error BadInput, discarding the line
int read_int(std::istream& in);

// Rest of the line with whitespace runs collapsed.
// @throw shelf::Error BadInput if the line is blank
std::string read_title(std::istream& in);

shelf::Record& read_record_by_id(Context& ctx);
shelf::Record& read_record_by_title(Context& ctx);
shelf::Collection& read_collection(Context& ctx);

} // namespace curator
