// D5.4 - Event token filter
// Tests: duplicate tokens rejected, token 0 untracked, FIFO eviction at
// capacity, clear.

#include "ri/session/EventTokenFilter.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  using namespace ri;

  // --- Test 1: duplicates ---
  {
    EventTokenFilter f;
    requireTrue(f.accept(7), "first sighting");
    requireTrue(!f.accept(7), "duplicate rejected");
    requireTrue(f.seen(7), "seen");
    requireTrue(f.accept(8), "another token");
    requireTrue(f.size() == 2, "two tracked");

    std::printf("  Test 1 (duplicates) PASS\n");
  }

  // --- Test 2: token 0 ---
  {
    EventTokenFilter f;
    requireTrue(f.accept(0) && f.accept(0), "0 always accepted");
    requireTrue(!f.seen(0) && f.size() == 0, "0 never recorded");

    std::printf("  Test 2 (untracked) PASS\n");
  }

  // --- Test 3: eviction ---
  {
    EventTokenFilter f(3);
    f.accept(1);
    f.accept(2);
    f.accept(3);
    f.accept(4);
    requireTrue(f.size() == 3, "bounded");
    requireTrue(!f.seen(1), "oldest evicted");
    requireTrue(f.seen(2) && f.seen(4), "newer kept");
    requireTrue(f.accept(1), "evicted token accepted again");

    EventTokenFilter big;
    for (std::uint64_t t = 1; t <= 300; t++) big.accept(t);
    requireTrue(big.size() == 256, "default capacity 256");
    requireTrue(!big.seen(44) && big.seen(45), "first 44 evicted");

    f.clear();
    requireTrue(f.size() == 0 && f.accept(2), "clear forgets");

    std::printf("  Test 3 (eviction) PASS\n");
  }

  std::printf("D5.4 token_filter: ALL PASS\n");
  return 0;
}
