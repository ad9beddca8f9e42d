// -----------------------------------------------------------------------------
// tree.cpp - command tree lookup and path expansion
//
// API & path notation:
//   see include/scpicore/tree.hpp
// -----------------------------------------------------------------------------
#include "scpicore/tree.hpp"

#include "scpicore/ascii.hpp"

namespace scpicore {

// ---------------------------------------------------------------------------
// Node::child()
// ---------------------------------------------------------------------------
const Node* Node::child(etl::string_view name) const {
  for (const Node* n = first_child_; n != nullptr; n = n->next_sibling_) {
    if (ascii::iequals(etl::string_view(n->name_.data(), n->name_.size()), name)) return n;
  }
  return nullptr;
}

Registration Registration::from_path(const char* path, CommandId id, uint8_t arity) {
  Registration reg;
  reg.path  = path;
  reg.id    = id;
  reg.arity = arity;
  if (path) {
    size_t n = 0;
    while (path[n]) ++n;
    reg.query = n > 0 && path[n - 1] == '?';
  }
  return reg;
}

const char* to_string(BuildResult result) {
  switch (result) {
    case BuildResult::Ok:               return "ok";
    case BuildResult::CommandExists:    return "command_exists";
    case BuildResult::QueryExists:      return "query_exists";
    case BuildResult::TooManyNodes:     return "too_many_nodes";
    case BuildResult::InvalidPath:      return "invalid_path";
    case BuildResult::TooManyCommands:  return "too_many_commands";
  }
  return "unknown";
}

// ---------- TreeBuilder ----------

TreeBuilder::TreeBuilder(etl::ivector<Node>& pool)
: pool_(pool) {
  pool_.clear();
  pool_.emplace_back();                  // root, always index 0
}

// ---------------------------------------------------------------------------
// insert()
// Split the path, then walk every long/short/omitted permutation.
// A failure part way leaves earlier permutations in place under reg.id, so
// the caller must never hand that id to another registration.
// ---------------------------------------------------------------------------
BuildResult TreeBuilder::insert(const Registration& reg) {
  Segments segs;
  bool query = reg.query;
  if (!split_path(reg.path, segs, query)) return BuildResult::InvalidPath;
  return insert_at(pool_[0], segs, 0, query, reg.id);
}

// ---------------------------------------------------------------------------
// split_path()
// "[SYSTem]:ERRor:COUNt?" -> {SYSTEM/SYST optional}, {ERROR/ERR}, {COUNT/COUN}
// A leading ':' is allowed. A trailing '?' sets `query`.
// ---------------------------------------------------------------------------
bool TreeBuilder::split_path(const char* path, Segments& out, bool& query) {
  if (!path) return false;

  size_t len = 0;
  while (path[len]) ++len;
  if (len > 0 && path[len - 1] == '?') { query = true; --len; }

  size_t i = 0;
  if (i < len && path[i] == ':') ++i;
  if (i >= len) return false;

  while (i < len) {
    size_t end = i;
    while (end < len && path[end] != ':') ++end;

    size_t first = i, last = end;                          // segment is [first, last)
    while (first < last && path[first] == ' ') ++first;
    while (last > first && path[last - 1] == ' ') --last;

    Segment seg;
    if (first < last && path[first] == '[') {
      if (path[last - 1] != ']') return false;
      seg.optional = true;
      ++first;
      --last;
    }
    if (first >= last) return false;
    if (last - first > Node::NAME_CAP) return false;

    for (size_t k = first; k < last; ++k) {
      const uint8_t c = static_cast<uint8_t>(path[k]);
      const bool leading_star = (c == '*' && k == first);
      if (!ascii::is_mnemonic(c) && !leading_star) return false;
      seg.long_name.push_back(ascii::to_upper(path[k]));
      if (!ascii::is_lower(c)) seg.short_name.push_back(path[k]);
    }
    if (seg.short_name.empty()) seg.short_name = seg.long_name;

    if (out.full()) return false;
    out.push_back(seg);

    i = end + 1;                                           // skip ':'
    if (end < len && i >= len) return false;              // trailing ':'
  }
  return true;
}

// ---------------------------------------------------------------------------
// insert_at()
// Recursive expansion. Re-registering the same id at a node is accepted so
// paths like "[A]:[A]" that reach one node twice do not conflict with
// themselves.
// ---------------------------------------------------------------------------
BuildResult TreeBuilder::insert_at(Node& node, const Segments& segs, size_t index,
                                   bool query, CommandId id) {
  if (index == segs.size()) {
    etl::optional<CommandId>& slot = query ? node.query_ : node.command_;
    if (slot.has_value() && slot.value() != id) {
      return query ? BuildResult::QueryExists : BuildResult::CommandExists;
    }
    slot = id;
    return BuildResult::Ok;
  }

  const Segment& seg = segs[index];

  Node* next = child_or_create(node, seg.long_name);
  if (!next) return BuildResult::TooManyNodes;
  BuildResult r = insert_at(*next, segs, index + 1, query, id);
  if (r != BuildResult::Ok) return r;

  if (seg.short_name != seg.long_name) {
    next = child_or_create(node, seg.short_name);
    if (!next) return BuildResult::TooManyNodes;
    r = insert_at(*next, segs, index + 1, query, id);
    if (r != BuildResult::Ok) return r;
  }

  if (seg.optional) return insert_at(node, segs, index + 1, query, id);
  return BuildResult::Ok;
}

// ---------------------------------------------------------------------------
// child_or_create()
// New children are appended so sibling order follows registration order.
// ---------------------------------------------------------------------------
Node* TreeBuilder::child_or_create(Node& parent, const Node::Name& name) {
  Node* last = nullptr;
  for (Node* n = parent.first_child_; n != nullptr; n = n->next_sibling_) {
    if (ascii::iequals(etl::string_view(n->name_.data(), n->name_.size()),
                       etl::string_view(name.data(), name.size()))) {
      return n;
    }
    last = n;
  }

  if (pool_.full()) return nullptr;
  pool_.emplace_back();
  Node* created = &pool_.back();
  created->name_ = name;
  if (last) last->next_sibling_ = created;
  else      parent.first_child_ = created;
  return created;
}

} // namespace scpicore
