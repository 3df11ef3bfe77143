#include "core/ResultSlot.hpp"

namespace core {

bool ResultSlot::offer(int workerId, const mpz_class& factor) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (winner_) {
        ++late_;
        return false;
    }
    winner_ = Winner{workerId, factor};
    return true;
}

bool ResultSlot::filled() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return winner_.has_value();
}

std::optional<ResultSlot::Winner> ResultSlot::winner() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return winner_;
}

size_t ResultSlot::lateOffers() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return late_;
}

} // namespace core
