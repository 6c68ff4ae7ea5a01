#include "parser/parse_cache.h"
#include "test_util.h"

namespace test {

void RunParseCacheTests(TestContext* ctx) {
  ps::CachePolicy policy;
  policy.max_entries = 2;
  ps::ParseCache cache(policy);

  auto first = cache.Parse("x+1");
  auto second = cache.Parse("x+1");
  ExpectTrue(first == second, "identical_source_hit", ctx);
  ExpectTrue(cache.hits() == 1 && cache.misses() == 1, "hit_miss_counters", ctx);

  cache.Parse("y");
  cache.Parse("x+1");  // refresh, "y" is now least recent
  cache.Parse("z");
  ExpectTrue(cache.size() == 2, "bounded_size", ctx);
  const uint64_t misses = cache.misses();
  cache.Parse("x+1");
  ExpectTrue(cache.misses() == misses, "recent_entry_survives_eviction", ctx);
  cache.Parse("y");
  ExpectTrue(cache.misses() == misses + 1, "least_recent_entry_evicted", ctx);

  ExpectThrowsKind([&] { cache.Parse("(x"); }, util::ErrorKind::kParse, "cache_parse_error",
                   ctx);
  ExpectTrue(cache.size() == 2, "failed_parse_not_cached", ctx);

  cache.Clear();
  ExpectTrue(cache.size() == 0, "clear_empties_cache", ctx);

  {
    ps::ParseCache spelled(ps::CachePolicy{});
    auto spaced = spelled.Parse("1/(x - x)");
    auto tight = spelled.Parse("1/(x-x)");
    ExpectTrue(spaced != tight && spelled.size() == 2, "spacing_variants_cached_apart", ctx);
    ExpectTrue(spaced->source == "1/(x - x)" && tight->source == "1/(x-x)",
               "cached_parse_keeps_its_source", ctx);
    ExpectTrue(spaced->root->end == 8 && tight->root->end == 6,
               "cached_offsets_match_source", ctx);
  }

  ps::CachePolicy off;
  off.enabled = false;
  ps::ParseCache disabled(off);
  auto a = disabled.Parse("x");
  auto b = disabled.Parse("x");
  ExpectTrue(a != b && disabled.size() == 0, "disabled_cache_parses_every_time", ctx);

  {
    ScopedEnvVar entries("MATHGRADE_PARSE_CACHE_ENTRIES", "7");
    ScopedEnvVar enabled("MATHGRADE_PARSE_CACHE", "off");
    auto loaded = ps::LoadCachePolicyFromEnv();
    ExpectTrue(loaded.max_entries == 7 && !loaded.enabled, "cache_policy_from_env", ctx);
  }
}

}  // namespace test
