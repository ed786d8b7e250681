#include <benchmark/benchmark.h>
#include <lumen/kernels/distance.hpp>
#include <vector>

using namespace lumen::kernels;

static void BenchSimilarity(benchmark::State& state){
  const auto dim = static_cast<std::size_t>(state.range(0));
  std::vector<float> a(dim), b(dim);
  for (std::size_t i=0;i<dim;++i){ a[i]=static_cast<float>(i)*0.5f; b[i]=static_cast<float>(dim-1-i)*0.25f; }
  normalize(a);
  normalize(b);
  for (auto _ : state) {
    benchmark::DoNotOptimize(similarity(a, b));
  }
  state.SetItemsProcessed(state.iterations());
}
// CLIP base and large dimensions
BENCHMARK(BenchSimilarity)->Arg(512)->Arg(768);

static void BenchNormalize(benchmark::State& state){
  const auto dim = static_cast<std::size_t>(state.range(0));
  std::vector<float> src(dim);
  for (std::size_t i=0;i<dim;++i) src[i]=static_cast<float>(i%17)-8.0f;
  std::vector<float> v(dim);
  for (auto _ : state) {
    v = src;
    benchmark::DoNotOptimize(normalize(v));
  }
}
BENCHMARK(BenchNormalize)->Arg(512)->Arg(768);

BENCHMARK_MAIN();
