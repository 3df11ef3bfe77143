// include/util/TeeBuf.hpp
#pragma once
#include <cstdio>
#include <mutex>
#include <streambuf>

namespace util {

// Duplicates everything written to it into two stream buffers. Tees that
// share a target must share the lock; one sputn is never interleaved.
class TeeBuf : public std::streambuf {
    std::streambuf* a_;
    std::streambuf* b_;
    std::mutex&     mtx_;
public:
    TeeBuf(std::streambuf* a, std::streambuf* b, std::mutex& mtx)
      : a_(a), b_(b), mtx_(mtx) {}
protected:
    int overflow(int ch) override {
        if (ch == EOF) return !EOF;
        std::lock_guard<std::mutex> lk(mtx_);
        const int r1 = a_ ? a_->sputc(static_cast<char>(ch)) : ch;
        const int r2 = b_ ? b_->sputc(static_cast<char>(ch)) : ch;
        return (r1 == EOF || r2 == EOF) ? EOF : ch;
    }
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::lock_guard<std::mutex> lk(mtx_);
        const std::streamsize n1 = a_ ? a_->sputn(s, n) : n;
        const std::streamsize n2 = b_ ? b_->sputn(s, n) : n;
        return n1 < n2 ? n1 : n2;
    }
    int sync() override {
        std::lock_guard<std::mutex> lk(mtx_);
        const int s1 = a_ ? a_->pubsync() : 0;
        const int s2 = b_ ? b_->pubsync() : 0;
        return (s1 == 0 && s2 == 0) ? 0 : -1;
    }
};

} // namespace util
