// -----------------------------------------------------------------------------
// interface.cpp - handler invocation shared by every Interface<N, M>
//
// Interface<N, M> is a template and lives in the header; only the part that
// does not depend on the capacities is compiled here.
// -----------------------------------------------------------------------------
#include "scpicore/interface.hpp"

namespace scpicore {

Error invoke(const CommandEntry* entry, const Arguments& args, Write& out) {
  if (!entry || !entry->handler.is_valid()) return Error::Code::UndefinedHeader; // unknown or refused id
  if (args.size() != entry->arity) return Error::Code::UnexpectedNumberOfParameters;
  return entry->handler(args, out);                    // handler owns the response bytes
}

} // namespace scpicore
