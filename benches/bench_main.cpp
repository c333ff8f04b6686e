#include <iostream>

void run_partition_benchmark();
void run_prompt_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "chunkguard benchmarks\n";
  run_partition_benchmark();
  run_prompt_benchmark();
  run_config_benchmark();
  return 0;
}
