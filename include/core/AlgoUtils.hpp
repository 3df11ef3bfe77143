// include/core/AlgoUtils.hpp
#pragma once
#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace core::algo {

// one flag for the whole program: set by SIGINT, polled by the scheduler
inline std::atomic<bool> interrupted{false};
inline void handle_sigint(int) { interrupted = true; }

inline static std::vector<std::string> parseConfigFile(const std::string& config_path) {
    std::ifstream config(config_path);
    std::vector<std::string> args;
    std::string line;

    if (!config.is_open()) {
        std::cerr << "Warning: no config file: " << config_path << std::endl;
        return args;
    }

    std::cout << "Loading options from config file: " << config_path << std::endl;

    while (std::getline(config, line)) {
        if (!line.empty() && line[0] == '#') continue;
        std::istringstream iss(line);
        std::string token;
        while (iss >> token) args.push_back(token);
    }

    if (!args.empty()) {
        std::cout << "Options from config file:" << std::endl;
        for (const auto& arg : args) {
            std::cout << "  " << arg << std::endl;
        }
    } else {
        std::cout << "No options found in config file." << std::endl;
    }

    return args;
}

} // namespace core::algo
