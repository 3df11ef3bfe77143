/*
 * TritFactor - chunked divisor search driven by an external qutrit engine
 *
 * The candidate interval [0, ceil(sqrt(N))) is cut into chunk-aligned blocks.
 * Each block is compiled into a .qbin program, executed by the engine in its
 * own process, and every measured candidate is checked with GMP.
 *
 * This code is released as free software.
 */
#include "core/App.hpp"
#include "util/TeeBuf.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

struct LogTee {
    std::ofstream file;
    std::mutex fileMtx;
    std::streambuf *oldCout = nullptr, *oldCerr = nullptr, *oldClog = nullptr;
    std::unique_ptr<util::TeeBuf> teeCout, teeCerr, teeClog;

    explicit LogTee(const std::string& path) : file(path, std::ios::app) {
        if (!file) return;
        oldCout = std::cout.rdbuf();
        oldCerr = std::cerr.rdbuf();
        oldClog = std::clog.rdbuf();
        teeCout = std::make_unique<util::TeeBuf>(oldCout, file.rdbuf(), fileMtx);
        teeCerr = std::make_unique<util::TeeBuf>(oldCerr, file.rdbuf(), fileMtx);
        teeClog = std::make_unique<util::TeeBuf>(oldClog, file.rdbuf(), fileMtx);
        std::cout.rdbuf(teeCout.get());
        std::cerr.rdbuf(teeCerr.get());
        std::clog.rdbuf(teeClog.get());
        std::cout.setf(std::ios::unitbuf);
        std::cerr.setf(std::ios::unitbuf);
        std::clog.setf(std::ios::unitbuf);
    }

    ~LogTee() {
        if (teeCout) std::cout.rdbuf(oldCout);
        if (teeCerr) std::cerr.rdbuf(oldCerr);
        if (teeClog) std::clog.rdbuf(oldClog);
        if (file) file.flush();
    }
};

int main(int argc, char** argv) {
    LogTee _tee("tritfactor.log");
    return core::App(argc, argv).run();
}
