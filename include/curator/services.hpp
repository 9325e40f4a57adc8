#pragma once

#include <mutex>
#include "curator/config.hpp"
#include "shelf/catalog.hpp"
#include "shelf/library.hpp"

namespace curator {

// Everything a command may touch. One per session, passed by reference.
struct Services {
  shelf::Library library;
  shelf::Catalog catalog;
  Config config;

  // guards library + catalog together, since memberships span both
  std::mutex mu;
};

} // namespace curator
