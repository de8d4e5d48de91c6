#include "temp_dir.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace test_utils {

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("dialogclean_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

fs::path TempDir::writeFile(const std::string& relative, const std::string& content) const {
    fs::path target = path_ / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + target.string());
    out << content;
    return target;
}

std::string TempDir::readFile(const std::string& relative) const {
    std::ifstream in(path_ / relative, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot read " + (path_ / relative).string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace test_utils
