#include "support.hpp"
#include <cassert>
#include <iostream>
#include <vector>

using namespace quantum;
using test::test_state;

// Reducers from one thread: the published states follow submission order.
int main() {
  constexpr int repetitions = 20;

  test::for_each_backend([&](const std::string& name, const threading& th) {
    for (int i = 0; i < repetitions; ++i) {
      thread_pool listeners{1};
      test::recorder<test_state> rec;

      store<test_state> s(test_state{}, test::delivered_on(th, listeners));
      auto sub = s.add_listener(rec.listener());

      std::vector<cycle_future> futures;
      for (int rev = 1; rev <= 7; ++rev) {
        futures.push_back(s.set_state([rev](const test_state& st){
          // each reducer only applies on top of its predecessor
          assert(st.revision == rev - 1);
          return test_state{rev, st.payload + rev};
        }));
      }
      s.quit_safely().join();
      listeners.quit().join();

      for (auto& f : futures) assert(f.completed());

      auto states = rec.states();
      assert(states.size() >= 2);
      assert((states.front() == test_state{}));
      assert((states.back() == test_state{7, 28}));
      for (std::size_t k = 1; k < states.size(); ++k) {
        assert(states[k - 1].revision < states[k].revision && "published out of order");
      }
    }
    std::cout << "  " << name << " ok\n";
  });

  std::cout << "[multiple_reducers_tests] OK\n";
  return 0;
}
