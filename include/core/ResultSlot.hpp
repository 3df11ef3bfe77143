// include/core/ResultSlot.hpp
#ifndef CORE_RESULTSLOT_HPP
#define CORE_RESULTSLOT_HPP

#include <cstddef>
#include <mutex>
#include <optional>
#include <gmpxx.h>

namespace core {

/// Single-assignment slot for the verified factor. The first offer wins,
/// every later offer is counted and dropped.
class ResultSlot {
public:
    struct Winner {
        int       workerId = -1;
        mpz_class factor;
    };

    bool offer(int workerId, const mpz_class& factor);

    bool filled() const;
    std::optional<Winner> winner() const;
    size_t lateOffers() const;

private:
    mutable std::mutex    mtx_;
    std::optional<Winner> winner_;
    size_t                late_ = 0;
};

} // namespace core

#endif // CORE_RESULTSLOT_HPP
