#include "support.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace quantum;
using test::test_state;

int main() {
  // disabled by default: nothing is recorded
  {
    store<test_state> s(test_state{}, threading::thread());
    assert(!s.history().enabled());
    s.set_state([](const test_state& st){ return test_state{st.revision + 1, 0}; });
    s.quit_safely().join();
    assert(s.history().size() == 0);
  }

  // one entry per applied reducer, no-ops included; more entries than publishes
  test::for_each_backend([](const std::string& name, const threading& th) {
    inline_executor here;
    test::recorder<test_state> rec;
    store<test_state> s(test_state{}, test::delivered_on(th, here));
    s.history().enable();
    auto sub = s.add_listener(rec.listener());

    s.set_state([](const test_state& st){ return test_state{st.revision + 1, 0}; });
    s.set_state([](const test_state& st){ return st; });
    s.set_state([](const test_state& st){ return test_state{st.revision + 1, 0}; });
    s.set_state([](const test_state& st){ return st; });
    s.quit_safely().join();

    auto entries = s.history().read();
    assert(entries.size() == 4);
    assert((entries[0] == test_state{1, 0}));
    assert((entries[1] == test_state{1, 0}));
    assert((entries[2] == test_state{2, 0}));
    assert((entries[3] == test_state{2, 0}));
    assert(entries.size() > rec.size() - 1 && "history may hold states that were never published");
    std::cout << "  " << name << " ok\n";
  });

  // readers on other threads while the store appends
  {
    constexpr int total = 5000;
    store<test_state> s(test_state{}, threading::thread());
    s.history().enable();

    std::atomic<bool> reading{true};
    std::thread reader([&]{
      std::size_t last = 0;
      while (reading.load()) {
        auto snapshot = s.history().read();
        assert(snapshot.size() >= last && "history is append-only");
        for (std::size_t k = 0; k < snapshot.size(); ++k) {
          assert(snapshot[k].revision == static_cast<int>(k) + 1);
        }
        last = snapshot.size();
      }
    });

    for (int k = 0; k < total; ++k) {
      s.set_state([](const test_state& st){ return test_state{st.revision + 1, 0}; });
    }
    s.quit_safely().join();
    reading.store(false);
    reader.join();

    assert(s.history().size() == static_cast<std::size_t>(total));
    s.history().clear();
    assert(s.history().size() == 0);
  }

  std::cout << "[history_tests] OK\n";
  return 0;
}
