#include <benchmark/benchmark.h>
#include <quantum/quantum.hpp>

using namespace quantum;

// Submit N increments and wait for the last one.
static void run_increments(benchmark::State& state, const threading& th) {
  inline_executor ui;
  auto opt = th;
  opt.deliver_on(ui);
  store<int> s(0, opt);
  volatile int sink = 0;

  auto sub = s.add_listener([&](const int& v){
    sink = v;
    benchmark::DoNotOptimize(sink);
  });

  for (auto _ : state) {
    cycle_future last;
    for (int i = 0; i < state.range(0); ++i) {
      benchmark::DoNotOptimize(i);
      last = s.set_state([](const int& v){ return v + 1; });
    }
    last.wait();
  }
  s.quit_safely().join();
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_set_state_thread(benchmark::State& state) {
  run_increments(state, threading::thread());
}
BENCHMARK(BM_set_state_thread)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_set_state_shared_pool(benchmark::State& state) {
  run_increments(state, threading::pool());
}
BENCHMARK(BM_set_state_shared_pool)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_set_state_sync(benchmark::State& state) {
  run_increments(state, threading::sync());
}
BENCHMARK(BM_set_state_sync)->Arg(100)->Arg(1000)->Arg(10000);

// Contended submission from several producers on the shared pool.
static void BM_set_state_contended(benchmark::State& state) {
  static store<int>* shared = nullptr;
  if (state.thread_index() == 0) {
    shared = new store<int>(0, threading::pool());
  }
  for (auto _ : state) {
    benchmark::DoNotOptimize(shared->set_state([](const int& v){ return v + 1; }));
  }
  if (state.thread_index() == 0) {
    shared->quit_safely().join();
    delete shared;
    shared = nullptr;
  }
}
BENCHMARK(BM_set_state_contended)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
