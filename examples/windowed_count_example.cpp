#include "winagg.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {
struct my_data {
  std::string key;
  winagg::timestamp event_at;
};

std::vector<my_data> samples() {
  constexpr winagg::timestamp second = 1000;
  constexpr winagg::timestamp base = 1000 * 1000;
  return {
      {"abc", base},                   // first event
      {"abc", base + 30 * second + 1}, // 30s and 1ms after the first event
      {"abc", base + 60 * second - 1}, // 59s and 999ms after the first event
      {"abc", base + 60 * second},     // exactly 60s after the first event
  };
}

void print(std::string const &title, winagg::window_options const &opts) {
  auto data = samples();
  auto results = winagg::windowed::count_per_key(
      data, winagg::make_assigner(opts), [](my_data const &d) { return d.key; },
      [](my_data const &d) { return d.event_at; });

  std::cout << title << ":\n";
  for (auto const &r : results) {
    std::cout << "key " << r.key << " count " << r.value << " [window timestamp " << r.output_time << "]\n";
  }
  std::cout << '\n';
}
} // namespace

int main() {
  using namespace std::chrono_literals;
  using namespace winagg;

  for (auto const &d : samples()) {
    std::cout << "key [" << d.key << "] event at [" << d.event_at << "]\n";
  }
  std::cout << '\n';

  print("Global window", global_window());
  print("Fixed windows of 30s", fixed_windows(30s));
  print("Fixed windows of 30s, offset 10s and 1ms", fixed_windows(30s).with_offset(10001ms));
  print("Sliding windows of 30s every 15s", sliding_windows(30s).every(15s));
  // Windows ending at 1027999 and 1051999 hold no event and are not printed
  print("Sliding windows of 20s every 12s", sliding_windows(20s).every(12s));

  return 0;
}
