#include <iostream>

void run_validator_benchmark();
void run_rate_limiter_benchmark();
void run_audit_benchmark();
void run_executor_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "paneguard benchmarks\n";
  run_validator_benchmark();
  run_rate_limiter_benchmark();
  run_audit_benchmark();
  run_executor_benchmark();
  run_config_benchmark();
  return 0;
}
