// include/core/Spinner.hpp
#pragma once
#include <cstdint>
#include <string>
#include <gmpxx.h>

namespace core {

class Spinner {
public:
  // One carriage-return progress line per call.
  void displayProgress(uint64_t blocksDone,
                       const mpz_class& blocksTotal,
                       double elapsedTime,
                       unsigned round,
                       unsigned rounds);

  // Terminates the progress line before other output.
  void finish();

private:
  size_t tick_ = 0;
  bool   drawn_ = false;
};

}
