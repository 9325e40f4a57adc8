#pragma once
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "context.hpp"
#include "shelf/error.hpp"
#include "shelf/text_io.hpp"

namespace curator {
  using HandlerFn = std::function<void(Context&)>;

  struct CommandDef {
    std::string name;          // two characters, as typed
    std::string description;
    HandlerFn handler;
  };

  class CommandRegistry {
   public:
    void add(CommandDef def) {
      std::string name = def.name;
      handlers_[name] = std::move(def.handler);
      defs_.push_back(std::move(def));
    }

    bool contains(const std::string& name) const {
      return handlers_.contains(name);
    }

    void describe(std::ostream& out) const {
      for (const auto& d : defs_) {
        out << "  " << d.name << "  " << d.description << "\n";
      }
    }

    // Runs one command. Errors are printed, after dropping the rest of the
    // line when the error asks for it.
    void dispatch(const std::string& name, Context& ctx) const {
      auto it = handlers_.find(name);
      if (it == handlers_.end()) {
        ctx.out << "Unrecognized command!\n";
        shelf::read_line(ctx.in);
        return;
      }

      std::lock_guard lk(ctx.services.mu);
      try {
        it->second(ctx);
      } catch (const shelf::Error& e) {
        if (e.discards_line()) shelf::read_line(ctx.in);
        ctx.out << e.what() << "\n";
      }
    }

   private:
    std::unordered_map<std::string, HandlerFn> handlers_;
    std::vector<CommandDef> defs_;
  };
}
