#include "support.hpp"
#include <cassert>
#include <iostream>
#include <latch>
#include <thread>
#include <vector>

using namespace quantum;
using test::test_state;

static test_state plus(const test_state& st, int n) { return test_state{st.revision + n, st.payload}; }

int main() {
  // an action observes every reducer queued before it
  test::for_each_backend([](const std::string& name, const threading& th) {
    store<test_state> s(test_state{}, th);
    std::vector<int> seen;
    for (int k = 1; k <= 50; ++k) {
      s.set_state([](const test_state& st){ return plus(st, 1); });
      s.with_state([&seen, k](const test_state& st){
        assert(st.revision >= k);
        seen.push_back(st.revision);
      });
    }
    s.quit_safely().join();
    assert(seen.size() == 50);
    for (std::size_t k = 1; k < seen.size(); ++k) assert(seen[k - 1] <= seen[k]);
    assert(seen.back() == 50);
    std::cout << "  " << name << " ok\n";
  });

  // sync: every submission is its own cycle, so actions see exactly their prefix
  {
    store<test_state> s(test_state{}, threading::sync());
    s.set_state([](const test_state& st){ return plus(st, 1); });
    int seen = 0;
    auto f = s.with_state([&](const test_state& st){ seen = st.revision; });
    assert(f.completed() && seen == 1);
    s.set_state([](const test_state& st){ return plus(st, 1); });
    assert(seen == 1);
    s.quit_safely().join();
  }

  // an action queued while a cycle runs waits for the next cycle, after the
  // reducers of that cycle
  {
    std::latch done{1};
    store<test_state> s(test_state{}, threading::thread());
    int seen = -1;
    s.set_state([&](const test_state& st){
      s.with_state([&](const test_state& now){ seen = now.revision; done.count_down(); });
      s.set_state([](const test_state& now){ return plus(now, 10); });
      return plus(st, 1);
    });
    done.wait();
    assert(seen == 11);
    s.quit_safely().join();
  }

  // actions run on the store's context, one after another
  {
    store<test_state> s(test_state{}, threading::thread());
    std::thread::id first{};
    std::vector<cycle_future> futures;
    bool same_thread = true;
    for (int k = 0; k < 20; ++k) {
      futures.push_back(s.with_state([&](const test_state&){
        if (first == std::thread::id{}) first = std::this_thread::get_id();
        else if (first != std::this_thread::get_id()) same_thread = false;
      }));
    }
    for (auto& f : futures) assert(f.wait() == cycle_status::completed);
    assert(same_thread);
    assert(first != std::this_thread::get_id());
    s.quit().join();
  }

  std::cout << "[action_tests] OK\n";
  return 0;
}
