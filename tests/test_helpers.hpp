#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace Memopair {
namespace Testing {

// One modkit bedMethyl line (18 columns).
inline std::string bedmethyl_line(const std::string& ref, int64_t pos, char strand, const std::string& code,
                                  uint32_t valid_cov, uint32_t n_mod, uint32_t n_canonical, uint32_t n_diff = 0) {
    double fraction = valid_cov > 0 ? 100.0 * n_mod / valid_cov : 0.0;
    std::ostringstream oss;
    oss << ref << "\t" << pos << "\t" << pos + 1 << "\t" << code << "\t" << valid_cov << "\t" << strand << "\t"
        << pos << "\t" << pos + 1 << "\t255,0,0\t" << valid_cov << "\t" << fraction << "\t" << n_mod << "\t"
        << n_canonical << "\t0\t0\t0\t" << n_diff << "\t0";
    return oss.str();
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path);
    ofs << content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Fresh directory per test, removed on teardown.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("memopair_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::filesystem::path dir_;
};

}  // namespace Testing
}  // namespace Memopair
