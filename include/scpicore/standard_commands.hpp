/**
 * @file standard_commands.hpp
 * @brief SCPI-99 mandatory SYSTem commands backed by an error queue.
 *
 * @details
 * | Path                      | Response                                  |
 * |---------------------------|-------------------------------------------|
 * | `SYSTem:ERRor[:NEXT]?`    | oldest error as `<n>,"<msg>"`, `0,"No error"` when empty |
 * | `SYSTem:ERRor:COUNt?`     | number of queued errors                   |
 * | `SYSTem:VERSion?`         | `1999.0` (bare)                           |
 *
 * @code
 *   scpicore::StaticErrorQueue<16> errors;
 *   scpicore::StandardCommands standard(errors);
 *   standard.install(iface);
 * @endcode
 */
#ifndef SCPICORE_STANDARD_COMMANDS_HPP
#define SCPICORE_STANDARD_COMMANDS_HPP

#include "scpicore/error_queue.hpp"
#include "scpicore/interface.hpp"

namespace scpicore {

class StandardCommands {
public:
  static constexpr const char* SCPI_VERSION = "1999.0";

  explicit StandardCommands(ErrorQueue& errors) : errors_(errors) {}

  template <size_t MaxNodes, size_t MaxCommands>
  BuildResult install(Interface<MaxNodes, MaxCommands>& iface) {
    BuildResult r = iface.add("SYSTem:ERRor[:NEXT]?", 0,
                              Handler::create<StandardCommands, &StandardCommands::error_next>(*this));
    if (r != BuildResult::Ok) return r;
    r = iface.add("SYSTem:ERRor:COUNt?", 0,
                  Handler::create<StandardCommands, &StandardCommands::error_count>(*this));
    if (r != BuildResult::Ok) return r;
    return iface.add("SYSTem:VERSion?", 0,
                     Handler::create<StandardCommands, &StandardCommands::version>(*this));
  }

  Error error_next(const Arguments& args, Write& out);
  Error error_count(const Arguments& args, Write& out);
  Error version(const Arguments& args, Write& out);

private:
  ErrorQueue& errors_;
};

} // namespace scpicore

#endif // SCPICORE_STANDARD_COMMANDS_HPP
