#include <quantum/quantum.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace quantum;
using namespace std::chrono_literals;

// A host loop that owns its thread (think game loop): the store runs its cycles
// cooperatively whenever the loop drains its strand.
int main() {
  strand loop;
  inline_executor same_thread;

  store<std::string> title(std::string("untitled"),
                           threading::cooperative(loop).deliver_on(same_thread));

  auto sub = title.add_listener([](const std::string& t){ std::cout << "[title] " << t << "\n"; });
  auto bye = title.add_quitted_listener([]{ std::cout << "[title] store stopped\n"; });

  std::thread background([&]{
    for (int i = 1; i <= 3; ++i) {
      std::this_thread::sleep_for(10ms);
      title.set_state([i](const std::string&){ return "chapter " + std::to_string(i); });
    }
    title.quit_safely();
  });

  // the host loop: frame, then drain
  while (title.phase() != lifecycle_phase::stopped) {
    std::this_thread::sleep_for(5ms);
    loop.drain();
  }

  background.join();
  return 0;
}
