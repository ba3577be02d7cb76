#include "support.hpp"
#include <cassert>
#include <iostream>
#include <thread>

using namespace quantum;

int main() {
  const auto before = current_settings();
  assert(before.default_threading.kind == threading_kind::pool && "pool by default");

  configure([](settings& s){ s.default_threading = threading::sync(); });
  assert(default_threading().kind == threading_kind::sync);

  // read at construction time
  {
    store<int> s(0);
    assert(s.threading_option().kind == threading_kind::sync);
    std::thread::id where{};
    s.with_state([&](const int&){ where = std::this_thread::get_id(); });
    assert(where == std::this_thread::get_id());

    // a store's option builds a sibling store the same way
    store<int> sibling(1, s.threading_option());
    assert(sibling.threading_option().kind == threading_kind::sync);
    sibling.quit().join();
    s.quit().join();
  }

  // changing the defaults does not touch existing stores
  store<int> thread_store(0, threading::thread());
  configure([&](settings& s){ s = before; });
  assert(thread_store.threading_option().kind == threading_kind::thread);
  assert(default_threading().kind == threading_kind::pool);
  thread_store.quit_safely().join();

  // threading values
  {
    thread_pool pool{1};
    auto t = threading::custom(pool);
    assert(t.kind == threading_kind::custom && t.exec.get() == &pool);
    assert(!t.callback);
    t.deliver_on(pool);
    assert(t.callback.get() == &pool);
    assert(threading::pool(4).pool_threads == 4);
    assert(threading::pool().pool_threads == 0);
  }

  std::cout << "[config_tests] OK\n";
  return 0;
}
