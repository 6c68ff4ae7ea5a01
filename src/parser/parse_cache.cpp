#include "parser/parse_cache.h"

#include <cstdlib>

#include "parser/parser.h"
#include "util/env.h"
#include "util/log.h"

namespace mathgrade::parser {

CachePolicy LoadCachePolicyFromEnv() {
  CachePolicy policy;
  uint64_t value = 0;
  if (util::ParseUint64(std::getenv("MATHGRADE_PARSE_CACHE_ENTRIES"), &value)) {
    policy.max_entries = value;
  }
  if (util::IsFalseEnvValue(std::getenv("MATHGRADE_PARSE_CACHE"))) {
    policy.enabled = false;
  }
  return policy;
}

ParseCache::ParseCache(CachePolicy policy) : policy_(policy) {}

std::shared_ptr<const ParsedExpression> ParseCache::Parse(const std::string& source) {
  if (!policy_.enabled || policy_.max_entries == 0) {
    return ParseFormula(source);
  }
  // Keyed by the exact text: node offsets and error locations index into the source.
  const std::string& key = source;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      lru_.splice(lru_.begin(), lru_, it->second.position);
      ++hits_;
      return it->second.parsed;
    }
    ++misses_;
  }

  // Parse outside the lock; a concurrent miss on the same key only costs a second parse.
  auto parsed = ParseFormula(source);

  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return it->second.parsed;
  }
  lru_.push_front(key);
  entries_.emplace(key, Entry{parsed, lru_.begin()});
  EvictIfNeeded();
  return parsed;
}

void ParseCache::EvictIfNeeded() {
  while (entries_.size() > policy_.max_entries && !lru_.empty()) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
    util::LogRecord rec;
    rec.level = util::LogLevel::kTrace;
    rec.component = "parse_cache";
    rec.operation = "evict";
    rec.message = victim;
    util::Log(rec);
  }
}

size_t ParseCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

uint64_t ParseCache::hits() const {
  std::lock_guard<std::mutex> lock(mu_);
  return hits_;
}

uint64_t ParseCache::misses() const {
  std::lock_guard<std::mutex> lock(mu_);
  return misses_;
}

void ParseCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  lru_.clear();
  entries_.clear();
}

}  // namespace mathgrade::parser
