#include <quantum/quantum.hpp>
#include <iostream>
#include <thread>
#include <vector>

using namespace quantum;

struct Counter {
  int value{0};
  int writers{0};
  bool operator==(const Counter& o) const { return value == o.value && writers == o.writers; }
};

int main() {
  thread_pool ui{1};  // "UI" - listeners are delivered here, one at a time

  store<Counter> counter(Counter{}, threading::pool().deliver_on(ui));
  counter.history().enable();

  auto sub = counter.add_listener([](const Counter& c){
    std::cout << "[state] value=" << c.value << " writers=" << c.writers << "\n";
  });

  // four producers, 250 increments each
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&counter]{
      for (int i = 0; i < 250; ++i) {
        counter.set_state([](const Counter& c){ return Counter{c.value + 1, c.writers}; });
      }
      counter.set_state([](const Counter& c){ return Counter{c.value, c.writers + 1}; });
    });
  }
  for (auto& t : producers) t.join();

  // a read-only action sees every reducer queued before it
  counter.with_state([](const Counter& c){
    std::cout << "[action] all writers done: " << (c.writers == 4 ? "yes" : "no") << "\n";
  });

  // run what is queued, then stop
  counter.quit_safely().join();
  ui.quit().join();

  std::cout << "history entries: " << counter.history().size() << "\n";
  return 0;
}
