#ifndef AUDIOBATCH_TESTS_TEMP_DIR_HPP
#define AUDIOBATCH_TESTS_TEMP_DIR_HPP

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace test_support {

// unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto name = "audiobatch-test-" + std::to_string(rd()) + std::to_string(rd());
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(const std::filesystem::path& rel) const { return path_ / rel; }

    // creates parent directories as needed
    std::filesystem::path write(const std::filesystem::path& rel, std::string_view contents = "x") const {
        const auto p = path_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << contents;
        return p;
    }

private:
    std::filesystem::path path_;
};

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace test_support

#endif // AUDIOBATCH_TESTS_TEMP_DIR_HPP
