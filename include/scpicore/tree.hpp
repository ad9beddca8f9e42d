/**
 * @file tree.hpp
 * @brief Static SCPI command tree: nodes, registrations and the startup builder.
 *
 * @details
 * ## Model
 * The tree is a trie over header mnemonics. Each `Node` has an ordered list of
 * named children and may carry a command id, a query id, or both. Lookups are
 * a linear ASCII case-insensitive scan of the children. Trees are small and
 * this keeps the structure free of hashing and allocation.
 *
 * ## Building
 * Commands are registered from path strings in the usual SCPI notation:
 * @code
 *   "[SYSTem]:ERRor:COUNt?"
 * @endcode
 * - Uppercase letters (plus digits, `*`, `_`) form the short spelling: `ERR`.
 * - The whole mnemonic, uppercased, is the long spelling: `ERROR`.
 * - `[...]` marks an optional segment that may be omitted.
 * - A trailing `?` registers a query instead of a command.
 *
 * Every permutation is inserted as its own path, so the example above resolves
 * from `SYST:ERR:COUN?`, `SYSTEM:ERROR:COUNT?`, `ERR:COUNT?` and so on.
 * Registering two commands (or two queries) at one node is a build error.
 *
 * ## Lifetime
 * A `CommandTree` is built once at startup, then only read. Nodes live in a
 * fixed `etl::vector` inside the tree, so node pointers stay valid for the
 * life of the tree. The tree is neither copyable nor movable.
 */
#ifndef SCPICORE_TREE_HPP
#define SCPICORE_TREE_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/optional.h"
#include "etl/string.h"
#include "etl/string_view.h"
#include "etl/vector.h"

namespace scpicore {

/// Opaque id of a registered handler.
using CommandId = uint16_t;

class Node {
public:
  static constexpr size_t NAME_CAP = 16;   ///< longest stored mnemonic (incl. leading '*')
  using Name = etl::string<NAME_CAP>;

  /// Child whose name matches @p name case-insensitively, or nullptr.
  const Node* child(etl::string_view name) const;

  const Name& name() const { return name_; }
  const Node* first_child() const { return first_child_; }
  const Node* next_sibling() const { return next_sibling_; }
  const etl::optional<CommandId>& command() const { return command_; }
  const etl::optional<CommandId>& query() const { return query_; }

private:
  friend class TreeBuilder;

  Name  name_{};
  Node* first_child_{nullptr};
  Node* next_sibling_{nullptr};
  etl::optional<CommandId> command_{};
  etl::optional<CommandId> query_{};
};

/// One entry of the registration table.
struct Registration {
  const char* path{nullptr};  ///< e.g. "MEASure:VOLTage[:DC]?"
  bool        query{false};   ///< register as query
  CommandId   id{0};          ///< handler id
  uint8_t     arity{0};       ///< exact number of arguments

  /// Build a registration, deriving `query` from a trailing '?' in @p path.
  static Registration from_path(const char* path, CommandId id, uint8_t arity);
};

enum class BuildResult : uint8_t {
  Ok = 0,
  CommandExists,  ///< another command already owns this path
  QueryExists,    ///< another query already owns this path
  TooManyNodes,   ///< node pool exhausted
  InvalidPath,    ///< empty, malformed or too long segment
  TooManyCommands ///< handler table full
};

const char* to_string(BuildResult result);

/**
 * @brief Inserts registrations into a caller-provided node pool.
 *
 * Use `CommandTree<N>`, which owns the pool; the builder is the capacity-free part.
 */
class TreeBuilder {
public:
  static constexpr size_t DEPTH_CAP = 8;   ///< max segments per path

  explicit TreeBuilder(etl::ivector<Node>& pool);

  TreeBuilder(const TreeBuilder&) = delete;
  TreeBuilder& operator=(const TreeBuilder&) = delete;

  BuildResult insert(const Registration& reg);

  const Node& root() const { return pool_[0]; }

private:
  struct Segment {
    Node::Name long_name;
    Node::Name short_name;
    bool       optional{false};
  };
  using Segments = etl::vector<Segment, DEPTH_CAP>;

  static bool split_path(const char* path, Segments& out, bool& query);
  BuildResult insert_at(Node& node, const Segments& segs, size_t index, bool query, CommandId id);
  Node* child_or_create(Node& parent, const Node::Name& name);

  etl::ivector<Node>& pool_;
};

/**
 * @brief Command tree with storage for @p MaxNodes nodes (root included).
 */
template <size_t MaxNodes>
class CommandTree {
  static_assert(MaxNodes > 0, "tree needs at least the root node");

public:
  CommandTree() : builder_(pool_) {}

  CommandTree(const CommandTree&) = delete;
  CommandTree& operator=(const CommandTree&) = delete;

  BuildResult insert(const Registration& reg) { return builder_.insert(reg); }

  const Node& root() const { return builder_.root(); }
  size_t node_count() const { return pool_.size(); }

private:
  etl::vector<Node, MaxNodes> pool_;
  TreeBuilder builder_;
};

} // namespace scpicore

#endif // SCPICORE_TREE_HPP
