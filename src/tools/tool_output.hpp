#pragma once
#include <fstream>
#include <stdexcept>
#include <string>

// Write a token or id to a file, failing if any byte did not reach it
inline void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}
