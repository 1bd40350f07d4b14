#ifndef PARALLELHEADERDEF
#define PARALLELHEADERDEF

#include <algorithm>
#include <thread>
#include <vector>


inline unsigned hardware_threads(const unsigned max_threads=64)
{
  unsigned hw = std::thread::hardware_concurrency();
  return std::max(1u, std::min(hw != 0 ? hw : 1, max_threads));
}

/* Split [0, n) into num_threads contiguous blocks, the last one taking the
   remainder, and run fn(th, begin, end) on each block in its own thread.
   fn must not throw. */
template<class Fn>
void run_blocks(const unsigned n, const unsigned num_threads, Fn fn)
{
  if (num_threads <= 1) {
    fn(0u, 0u, n);
    return;
  }
  std::vector<std::thread> threads;
  unsigned th, j, k, block_size;
  block_size = n / num_threads;
  j = 0;
  for (th = 0; th < (num_threads - 1); ++th) {
    k = j + block_size;
    threads.push_back(std::thread(fn, th, j, k));
    j = k;
  }
  threads.push_back(std::thread(fn, th, j, n));
  for (auto& thread : threads) {
    thread.join();
  }
}

#endif
