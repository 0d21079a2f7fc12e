#include "lfly/retry_counter.hpp"

#include <iostream>
#include <thread>
#include <vector>

int main() {
  const std::string a(64, 'a');
  const std::string b(64, 'b');

  lfly::RetryCounter rc{2};
  if (rc.count_for(a) != 0 || !rc.can_retry(a).second) {
    std::cerr << "fresh oid should be retriable with count 0\n";
    return 1;
  }
  rc.increment(a);
  if (auto [n, ok] = rc.can_retry(a); n != 1 || !ok) {
    std::cerr << "after one failure: count " << n << ", ok " << ok << "\n";
    return 1;
  }
  rc.increment(a);
  if (auto [n, ok] = rc.can_retry(a); n != 2 || ok) {
    std::cerr << "budget of 2 should be exhausted, count " << n << "\n";
    return 1;
  }
  if (rc.count_for(b) != 0) {
    std::cerr << "counts leak between oids\n";
    return 1;
  }

  // max < 1 is treated as 1
  for (int bad : {0, -5}) {
    lfly::RetryCounter one{bad};
    if (one.max_attempts() != 1) {
      std::cerr << "max " << bad << " not coerced to 1\n";
      return 1;
    }
    one.increment(a);
    if (one.can_retry(a).second) {
      std::cerr << "coerced counter allowed a retry\n";
      return 1;
    }
  }

  // concurrent increments are not lost
  lfly::RetryCounter big{1000000};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 1000; ++i)
        big.increment(b);
    });
  }
  for (auto &t : threads)
    t.join();
  if (big.count_for(b) != 8000) {
    std::cerr << "lost increments: " << big.count_for(b) << "\n";
    return 1;
  }

  std::cout << "retry counter OK\n";
  return 0;
}
