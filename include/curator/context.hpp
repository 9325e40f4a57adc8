#pragma once

#include <istream>
#include <ostream>
#include "curator/services.hpp"

namespace curator {

struct Context {
  std::istream& in;     // arguments are read from here
  std::ostream& out;    // confirmations and listings go here
  Services& services;
};

} // namespace curator
