#include "bench_common.hpp"

#include "engram/config/schema.hpp"
#include "engram/memory/mod.hpp"

#include <filesystem>

void run_memory_benchmark() {
  const auto workspace = std::filesystem::temp_directory_path() / "engram-memory-bench";
  std::error_code ec;
  std::filesystem::remove_all(workspace, ec);

  engram::memory::SqliteMemoryStore store(workspace / "memory.db",
                                          engram::config::MemoryConfig{});
  if (!store.health_check()) {
    std::cerr << "memory benchmark skipped: store not available\n";
    return;
  }

  int i = 0;
  engram::bench::run_bench("memory_add", 500, [&] {
    engram::memory::NewMemory input;
    input.content = "benchmark fact number " + std::to_string(i);
    input.importance = static_cast<double>(i % 10) / 10.0;
    ++i;
    (void)store.add(input);
  });

  engram::memory::MemoryQuery query;
  query.text = "benchmark fact";
  query.limit = 10;
  engram::bench::run_bench("memory_search", 200, [&] { (void)store.search(query); });

  engram::bench::run_bench("memory_find_similar", 200, [&] {
    (void)engram::memory::find_similar(store, "benchmark fact number 42",
                                       engram::memory::MemoryType::Fact);
  });

  std::filesystem::remove_all(workspace, ec);
}
