#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "junction/flat-hash-map.hpp"
#include "junction/http-method.hpp"
#include "junction/path-param-capture.hpp"
#include "junction/path-pattern.hpp"
#include "junction/vector.hpp"

namespace junction {

// Endpoints are stored by the owner of the tree, nodes only keep their index.
using EndpointIdx = uint32_t;

inline constexpr EndpointIdx kNoEndpoint = std::numeric_limits<EndpointIdx>::max();

class RouteNode {
 private:
  // Only RouteTree creates nodes.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  RouteNode(ConstructionKey, const PathSegment& segment, std::string pattern);

  RouteNode(const RouteNode&) = delete;
  RouteNode& operator=(const RouteNode&) = delete;

  // Canonical pattern leading to this node, e.g. "/users/{id}".
  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] PathSegment::Kind kind() const noexcept { return _kind; }

  // Shape required from the segment bound by a capture node.
  [[nodiscard]] PathSegment::Constraint constraint() const noexcept { return _constraint; }

  // Endpoint registered for exactly 'method', kNoEndpoint if none.
  [[nodiscard]] EndpointIdx endpointFor(http::Method method) const noexcept {
    return _methodEndpoints[http::MethodToIdx(method)];
  }

  // Endpoint of the match-all-verbs slot, kNoEndpoint if none.
  [[nodiscard]] EndpointIdx anyMethodEndpoint() const noexcept { return _anyMethodEndpoint; }

  // Bitmap of the verbs explicitly registered on this node (the match-all-verbs slot is not reflected).
  [[nodiscard]] http::MethodBmp registeredMethods() const noexcept;

  // Tells whether some endpoint is registered on this node. Nodes without endpoints never match.
  [[nodiscard]] bool hasEndpoint() const noexcept;

 private:
  friend class RouteTree;

  // Literal keys are views on the child's own _segmentText, stable as children are heap allocated.
  using LiteralChildren = flat_hash_map<std::string_view, std::unique_ptr<RouteNode>>;

  LiteralChildren _literalChildren;
  std::unique_ptr<RouteNode> _captureChild;
  std::unique_ptr<RouteNode> _wildcardChild;

  std::string _segmentText;  // literal text, capture name or tail name
  std::string _extName;      // name bound to the optional ".ext" suffix, empty if none
  std::string _pattern;

  std::array<EndpointIdx, http::kNbMethods> _methodEndpoints;
  EndpointIdx _anyMethodEndpoint{kNoEndpoint};

  PathSegment::Kind _kind;
  PathSegment::Constraint _constraint;
};

struct RouteMatch {
  enum class Kind : std::uint8_t { Matched, NotFound, MethodNotAllowed };

  [[nodiscard]] bool matched() const noexcept { return kind == Kind::Matched; }

  Kind kind{Kind::NotFound};

  // Index of the endpoint to dispatch to when Matched, kNoEndpoint otherwise.
  EndpointIdx endpointIdx{kNoEndpoint};

  // Matched node for Matched and MethodNotAllowed, nullptr for NotFound.
  const RouteNode* pNode{nullptr};

  // Captured parameters in pattern order. Keys point into the tree, values into the matched path.
  vector<PathParamCapture> params;

  // Path part matched by a terminal wildcard or "{name:path}", without leading nor trailing slash.
  // Points into the matched path.
  std::string_view remainder;
};

// Route tree mapping path patterns to per-verb endpoint indexes.
//
// The tree is mutated through insert / setEndpoint during a single-threaded setup phase. Afterwards match() is
// const and keeps no state in the tree so that concurrent lookups need no synchronization.
//
// Matching walks the request segments depth-first, trying at each node the literal child first (hashed lookup),
// then the capture child, then the terminal wildcard child, backtracking in that order when a branch does not
// reach a node having endpoints. A capture child is only tried on segments satisfying its constraint. A child
// with an optional extension is tried on the whole segment first, then on the segment split at a dot.
class RouteTree {
 public:
  RouteTree();

  RouteTree(const RouteTree&) = delete;
  RouteTree& operator=(const RouteTree&) = delete;

  RouteTree(RouteTree&&) noexcept = default;
  RouteTree& operator=(RouteTree&&) noexcept = default;

  ~RouteTree();

  [[nodiscard]] RouteNode& root() noexcept { return *_pRoot; }
  [[nodiscard]] const RouteNode& root() const noexcept { return *_pRoot; }

  // Walks down from 'from' along 'segments', creating missing nodes and reusing identical ones.
  // 'fullPattern' is only used for error reporting.
  // Throws PatternError (ConflictingCaptureName) if a capture or tail child with another name, constraint or extension
  // exists at the same position, or a literal child with another extension.
  RouteNode& insert(RouteNode& from, std::span<const PathSegment> segments, std::string_view fullPattern);

  // Parses 'pattern' and inserts it from the root.
  RouteNode& insert(std::string_view pattern);

  // Sets the endpoint of 'node' for 'method' and returns the previous one (kNoEndpoint if none).
  static EndpointIdx setEndpoint(RouteNode& node, http::Method method, EndpointIdx endpointIdx) noexcept;

  // Sets the match-all-verbs endpoint of 'node' and returns the previous one (kNoEndpoint if none).
  static EndpointIdx setAnyMethodEndpoint(RouteNode& node, EndpointIdx endpointIdx) noexcept;

  // Matches a concrete request path.
  //  - Matched when the reached node has an endpoint for 'method', or a match-all-verbs endpoint, or when
  //    'headFallbackToGet' is set, 'method' is HEAD and the node has a GET endpoint.
  //  - MethodNotAllowed when the reached node has endpoints, but none for this request.
  //  - NotFound otherwise.
  // Empty segments are ignored, so "/a/b/", "/a//b" and "/a/b" match identically.
  [[nodiscard]] RouteMatch match(http::Method method, std::string_view path, bool headFallbackToGet = false) const;

  // Matches a concrete request path for an extension method (a valid method token outside http::Method, like
  // PROPFIND). Only the match-all-verbs endpoint of the reached node can serve it, MethodNotAllowed otherwise.
  [[nodiscard]] RouteMatch matchExtension(std::string_view path) const;

  // Nodes having at least one endpoint, sorted by pattern.
  [[nodiscard]] vector<const RouteNode*> routeNodes() const;

 private:
  static RouteNode& ensureChild(RouteNode& node, const PathSegment& segment, std::string_view fullPattern);

  // Finds the node reached by 'path', binding the captures and remainder into 'result'. nullptr if none.
  const RouteNode* findNode(std::string_view path, RouteMatch& result) const;

  std::unique_ptr<RouteNode> _pRoot;
};

}  // namespace junction
