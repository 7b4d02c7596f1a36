#pragma once
// ============================================================
// test_helpers.hpp -- Small file helpers shared by the tests
// ============================================================

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace test_util {

// Whole file as a string; empty if it cannot be opened
inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

} // namespace test_util
