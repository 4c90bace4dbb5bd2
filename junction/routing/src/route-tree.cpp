#include "junction/route-tree.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "junction/http-method.hpp"
#include "junction/path-pattern.hpp"
#include "junction/pattern-error.hpp"
#include "junction/smallvector.hpp"
#include "junction/vector.hpp"

namespace junction {

namespace {

// Request paths deeper than this, or backtracking more, spill to the heap.
constexpr std::size_t kNbInlineSegments = 16;
constexpr std::size_t kNbInlineFrames = 32;

std::string ChildPattern(std::string_view parentPattern, const PathSegment& segment) {
  std::string out(parentPattern);
  if (!out.ends_with('/')) {
    out.push_back('/');
  }
  AppendSegment(segment, out);
  return out;
}

// Strips the trailing slashes of the wildcard remainder ("a/b/" -> "a/b").
std::string_view TrimRemainder(std::string_view remainder) {
  while (remainder.ends_with('/')) {
    remainder.remove_suffix(1);
  }
  return remainder;
}

}  // namespace

RouteNode::RouteNode(ConstructionKey, const PathSegment& segment, std::string pattern)
    : _segmentText(segment.text),
      _extName(segment.extName),
      _pattern(std::move(pattern)),
      _kind(segment.kind),
      _constraint(segment.constraint) {
  _methodEndpoints.fill(kNoEndpoint);
}

http::MethodBmp RouteNode::registeredMethods() const noexcept {
  http::MethodBmp methods = 0;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (_methodEndpoints[methodIdx] != kNoEndpoint) {
      methods = methods | http::MethodFromIdx(methodIdx);
    }
  }
  return methods;
}

bool RouteNode::hasEndpoint() const noexcept {
  return _anyMethodEndpoint != kNoEndpoint ||
         std::ranges::any_of(_methodEndpoints, [](EndpointIdx idx) { return idx != kNoEndpoint; });
}

RouteTree::RouteTree() : _pRoot(std::make_unique<RouteNode>(RouteNode::ConstructionKey{}, PathSegment{}, "/")) {}

RouteTree::~RouteTree() = default;

RouteNode& RouteTree::ensureChild(RouteNode& node, const PathSegment& segment, std::string_view fullPattern) {
  std::unique_ptr<RouteNode>* pSlot;
  switch (segment.kind) {
    case PathSegment::Kind::Literal: {
      auto it = node._literalChildren.find(std::string_view(segment.text));
      if (it != node._literalChildren.end()) {
        if (it->second->_extName != segment.extName) {
          throw PatternError(PatternErrorCode::ConflictingCaptureName, fullPattern, segment.offset);
        }
        return *it->second;
      }
      auto child = std::make_unique<RouteNode>(RouteNode::ConstructionKey{}, segment,
                                               ChildPattern(node._pattern, segment));
      RouteNode& ret = *child;
      node._literalChildren.emplace(std::string_view(ret._segmentText), std::move(child));
      return ret;
    }
    case PathSegment::Kind::Capture:
      pSlot = &node._captureChild;
      break;
    case PathSegment::Kind::Wildcard:
      pSlot = &node._wildcardChild;
      break;
    default:
      throw PatternError(PatternErrorCode::MisplacedWildcard, fullPattern, segment.offset);
  }
  std::unique_ptr<RouteNode>& slot = *pSlot;
  if (slot) {
    if (slot->_segmentText != segment.text || slot->_constraint != segment.constraint ||
        slot->_extName != segment.extName) {
      throw PatternError(PatternErrorCode::ConflictingCaptureName, fullPattern, segment.offset);
    }
    return *slot;
  }
  slot = std::make_unique<RouteNode>(RouteNode::ConstructionKey{}, segment, ChildPattern(node._pattern, segment));
  return *slot;
}

RouteNode& RouteTree::insert(RouteNode& from, std::span<const PathSegment> segments, std::string_view fullPattern) {
  RouteNode* pNode = &from;
  for (const PathSegment& segment : segments) {
    if (pNode->_kind == PathSegment::Kind::Wildcard) {
      // only reachable when walking below a node created for a terminal wildcard
      throw PatternError(PatternErrorCode::MisplacedWildcard, fullPattern, segment.offset);
    }
    pNode = &ensureChild(*pNode, segment, fullPattern);
  }
  return *pNode;
}

RouteNode& RouteTree::insert(std::string_view pattern) {
  const PathPattern segments = ParsePattern(pattern);
  return insert(*_pRoot, std::span<const PathSegment>(segments.data(), segments.size()), pattern);
}

EndpointIdx RouteTree::setEndpoint(RouteNode& node, http::Method method, EndpointIdx endpointIdx) noexcept {
  return std::exchange(node._methodEndpoints[http::MethodToIdx(method)], endpointIdx);
}

EndpointIdx RouteTree::setAnyMethodEndpoint(RouteNode& node, EndpointIdx endpointIdx) noexcept {
  return std::exchange(node._anyMethodEndpoint, endpointIdx);
}

const RouteNode* RouteTree::findNode(std::string_view path, RouteMatch& result) const {
  struct StackFrame {
    const RouteNode* pNode;
    std::string_view value;  // segment bound by a capture node
    std::string_view ext;    // extension bound by the node, empty if none
    uint32_t segmentIdx;     // first segment not consumed yet
    uint32_t nbCaptures;     // bound parameters before this node
    uint8_t stage;           // 0 enter node, then next child kind to try: 1 literal, 2 capture, 3 wildcard
  };

  SmallVector<std::string_view, kNbInlineSegments> segments;
  SplitPathSegments(path, segments);

  SmallVector<StackFrame, kNbInlineFrames> stack;
  stack.push_back(StackFrame{_pRoot.get(), {}, {}, 0, 0, 0});
  while (!stack.empty()) {
    StackFrame frame = stack.back();
    stack.pop_back();
    result.params.resize(frame.nbCaptures);

    const RouteNode& node = *frame.pNode;
    if (frame.stage == 0) {
      if (node._kind == PathSegment::Kind::Capture) {
        result.params.push_back(PathParamCapture{node._segmentText, frame.value});
      }
      if (!frame.ext.empty()) {
        result.params.push_back(PathParamCapture{node._extName, frame.ext});
      }
      frame.nbCaptures = static_cast<uint32_t>(result.params.size());
      if (frame.segmentIdx == segments.size()) {
        if (node.hasEndpoint()) {
          return &node;
        }
        // an unnamed terminal wildcard also matches zero remaining segments
        if (node._wildcardChild && node._wildcardChild->_segmentText.empty() && node._wildcardChild->hasEndpoint()) {
          return node._wildcardChild.get();
        }
        continue;
      }
      frame.stage = 1;
    }

    const std::string_view segment = segments[frame.segmentIdx];
    const uint32_t nextIdx = frame.segmentIdx + 1;
    switch (frame.stage) {
      case 1: {
        stack.push_back(StackFrame{frame.pNode, {}, {}, frame.segmentIdx, frame.nbCaptures, 2});
        // tried in order: literal "a.b.c", then "a.b" with ext "c", then "a" with ext "b.c"
        for (auto dotPos = segment.find('.'); dotPos != std::string_view::npos && dotPos + 1 != segment.size();
             dotPos = segment.find('.', dotPos + 1)) {
          const auto it = node._literalChildren.find(segment.substr(0, dotPos));
          if (it != node._literalChildren.end() && !it->second->_extName.empty()) {
            stack.push_back(
                StackFrame{it->second.get(), {}, segment.substr(dotPos + 1), nextIdx, frame.nbCaptures, 0});
          }
        }
        const auto it = node._literalChildren.find(segment);
        if (it != node._literalChildren.end()) {
          stack.push_back(StackFrame{it->second.get(), {}, {}, nextIdx, frame.nbCaptures, 0});
        }
        break;
      }
      case 2: {
        stack.push_back(StackFrame{frame.pNode, {}, {}, frame.segmentIdx, frame.nbCaptures, 3});
        const RouteNode* pChild = node._captureChild.get();
        if (pChild == nullptr) {
          break;
        }
        // with an extension, "42.json" binds 42 and json before trying "42.json" as a whole
        if (SatisfiesConstraint(pChild->_constraint, segment)) {
          stack.push_back(StackFrame{pChild, segment, {}, nextIdx, frame.nbCaptures, 0});
        }
        if (!pChild->_extName.empty()) {
          const auto dotPos = segment.find('.');
          if (dotPos != std::string_view::npos && dotPos + 1 != segment.size() &&
              SatisfiesConstraint(pChild->_constraint, segment.substr(0, dotPos))) {
            stack.push_back(StackFrame{pChild, segment.substr(0, dotPos), segment.substr(dotPos + 1), nextIdx,
                                       frame.nbCaptures, 0});
          }
        }
        break;
      }
      default: {
        const RouteNode* pChild = node._wildcardChild.get();
        if (pChild != nullptr && pChild->hasEndpoint()) {
          result.remainder = TrimRemainder(path.substr(static_cast<std::size_t>(segment.data() - path.data())));
          if (!pChild->_segmentText.empty()) {
            result.params.push_back(PathParamCapture{pChild->_segmentText, result.remainder});
          }
          return pChild;
        }
        break;
      }
    }
  }
  result.params.clear();
  return nullptr;
}

RouteMatch RouteTree::match(http::Method method, std::string_view path, bool headFallbackToGet) const {
  RouteMatch result;
  const RouteNode* pMatchedNode = findNode(path, result);
  if (pMatchedNode == nullptr) {
    return result;
  }

  result.pNode = pMatchedNode;
  EndpointIdx endpointIdx = pMatchedNode->endpointFor(method);
  if (endpointIdx == kNoEndpoint) {
    endpointIdx = pMatchedNode->_anyMethodEndpoint;
  }
  if (endpointIdx == kNoEndpoint && headFallbackToGet && method == http::Method::HEAD) {
    endpointIdx = pMatchedNode->endpointFor(http::Method::GET);
  }
  result.endpointIdx = endpointIdx;
  result.kind = endpointIdx == kNoEndpoint ? RouteMatch::Kind::MethodNotAllowed : RouteMatch::Kind::Matched;
  return result;
}

RouteMatch RouteTree::matchExtension(std::string_view path) const {
  RouteMatch result;
  const RouteNode* pMatchedNode = findNode(path, result);
  if (pMatchedNode == nullptr) {
    return result;
  }

  result.pNode = pMatchedNode;
  result.endpointIdx = pMatchedNode->_anyMethodEndpoint;
  result.kind = result.endpointIdx == kNoEndpoint ? RouteMatch::Kind::MethodNotAllowed : RouteMatch::Kind::Matched;
  return result;
}

vector<const RouteNode*> RouteTree::routeNodes() const {
  vector<const RouteNode*> nodes;
  vector<const RouteNode*> toVisit;
  toVisit.push_back(_pRoot.get());
  while (!toVisit.empty()) {
    const RouteNode* pNode = toVisit.back();
    toVisit.pop_back();
    if (pNode->hasEndpoint()) {
      nodes.push_back(pNode);
    }
    for (const auto& entry : pNode->_literalChildren) {
      toVisit.push_back(entry.second.get());
    }
    if (pNode->_captureChild) {
      toVisit.push_back(pNode->_captureChild.get());
    }
    if (pNode->_wildcardChild) {
      toVisit.push_back(pNode->_wildcardChild.get());
    }
  }
  std::ranges::sort(nodes, [](const RouteNode* lhs, const RouteNode* rhs) { return lhs->pattern() < rhs->pattern(); });
  return nodes;
}

}  // namespace junction
