/**
 * @file interface.hpp
 * @brief Command registration and id-to-handler dispatch.
 *
 * @details
 * An instrument describes itself to the interpreter through two things:
 * - a command tree (which header spellings exist), and
 * - a `Dispatcher` (what runs for each command id).
 *
 * `Interface<MaxNodes, MaxCommands>` bundles both. Each `add()` assigns the
 * next command id, expands the path into the tree and binds the handler with
 * its exact arity:
 * @code
 *   class Supply {
 *   public:
 *     scpicore::Error set_volts(const scpicore::Arguments& args, scpicore::Write&);
 *   };
 *
 *   Supply supply;
 *   scpicore::Interface<64, 16> iface;
 *   iface.add("SOURce:VOLTage[:LEVel]", 1,
 *             scpicore::Handler::create<Supply, &Supply::set_volts>(supply));
 * @endcode
 *
 * Handlers are `etl::delegate`s: no allocation, and the bound object must
 * outlive the interface. The arity check happens before the handler runs.
 */
#ifndef SCPICORE_INTERFACE_HPP
#define SCPICORE_INTERFACE_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/delegate.h"
#include "etl/vector.h"
#include "scpicore/error.hpp"
#include "scpicore/response.hpp"
#include "scpicore/tree.hpp"
#include "scpicore/value.hpp"

namespace scpicore {

/// Handler body: read arguments, write the query result (if any) into the sink.
using Handler = etl::delegate<Error(const Arguments&, Write&)>;

/// Runs the handler registered for a command id.
class Dispatcher {
public:
  virtual ~Dispatcher() = default;
  virtual Error execute_command(CommandId id, const Arguments& args, Write& out) = 0;
};

struct CommandEntry {
  Handler handler{};
  uint8_t arity{0};
};

/// Arity check then call. Unknown or unbound entries are `UndefinedHeader`.
Error invoke(const CommandEntry* entry, const Arguments& args, Write& out);

template <size_t MaxNodes, size_t MaxCommands>
class Interface : public Dispatcher {
public:
  Interface() = default;
  Interface(const Interface&) = delete;
  Interface& operator=(const Interface&) = delete;

  /**
   * @brief Register a command or query (trailing '?') under @p path.
   * @return BuildResult::Ok, or why the registration was refused.
   */
  BuildResult add(const char* path, uint8_t arity, Handler handler) {
    if (entries_.full()) return BuildResult::TooManyCommands;
    const CommandId id = static_cast<CommandId>(entries_.size());
    const BuildResult r = tree_.insert(Registration::from_path(path, id, arity));
    if (r == BuildResult::InvalidPath) return r;     // refused before touching the tree

    // A conflict or a full pool can leave some spellings behind under `id`.
    // The id stays taken by an unbound entry so they answer UndefinedHeader.
    entries_.push_back(r == BuildResult::Ok ? CommandEntry{handler, arity} : CommandEntry{});
    return r;
  }

  Error execute_command(CommandId id, const Arguments& args, Write& out) override {
    const CommandEntry* entry = (id < entries_.size()) ? &entries_[id] : nullptr;
    return invoke(entry, args, out);
  }

  const Node& root() const { return tree_.root(); }
  size_t command_count() const { return entries_.size(); }
  size_t node_count() const { return tree_.node_count(); }

private:
  CommandTree<MaxNodes> tree_;
  etl::vector<CommandEntry, MaxCommands> entries_;
};

} // namespace scpicore

#endif // SCPICORE_INTERFACE_HPP
