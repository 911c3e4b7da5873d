#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace metrics_adapter::test {

/** @brief Unique directory under the system temp path, removed on destruction. */
class TempDirectory final {
  public:
    TempDirectory() {
        std::random_device random_source;
        path_ = std::filesystem::temp_directory_path()
            / ("metrics_adapter_test_" + std::to_string(random_source()) + std::to_string(random_source()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path write_file(const std::string& name, const std::string& contents) const {
        const std::filesystem::path target = path_ / name;
        std::ofstream stream{target, std::ios::binary | std::ios::trunc};
        stream << contents;
        return target;
    }

  private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& source) {
    std::ifstream stream{source, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

}  // namespace metrics_adapter::test
