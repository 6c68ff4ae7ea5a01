#ifndef MATHGRADE_PARSER_PARSE_CACHE_H_
#define MATHGRADE_PARSER_PARSE_CACHE_H_

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "parser/ast.h"

namespace mathgrade::parser {

struct CachePolicy {
  uint64_t max_entries = 1024;
  bool enabled = true;
};

/// Reads MATHGRADE_PARSE_CACHE_ENTRIES and MATHGRADE_PARSE_CACHE.
CachePolicy LoadCachePolicyFromEnv();

/// Bounded LRU cache of parsed formulas keyed by the exact source text. Entries
/// are immutable and shared; failed parses are never cached.
class ParseCache {
 public:
  explicit ParseCache(CachePolicy policy = LoadCachePolicyFromEnv());

  bool Enabled() const { return policy_.enabled; }

  /// Returns the cached parse of `source`, parsing and inserting it on a miss.
  std::shared_ptr<const ParsedExpression> Parse(const std::string& source);

  size_t size() const;
  uint64_t hits() const;
  uint64_t misses() const;
  void Clear();

 private:
  using LruList = std::list<std::string>;
  struct Entry {
    std::shared_ptr<const ParsedExpression> parsed;
    LruList::iterator position;
  };

  void EvictIfNeeded();

  CachePolicy policy_;
  LruList lru_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  mutable std::mutex mu_;
};

}  // namespace mathgrade::parser

#endif  // MATHGRADE_PARSER_PARSE_CACHE_H_
