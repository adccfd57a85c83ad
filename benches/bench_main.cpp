#include <iostream>

void run_embedding_benchmark();
void run_memory_benchmark();

int main() {
  std::cout << "engram benchmarks\n";
  run_embedding_benchmark();
  run_memory_benchmark();
  return 0;
}
