// Shared helpers for the framework-free test executables (run via CTest).
#pragma once
#include "sftpovw/MockSftpSession.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>

namespace sftpovw_test {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }

    int finish(const char *suite) const {
        if (failures != 0) {
            std::cerr << "[FAILURES] " << failures << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "[OK] " << suite << "\n";
        return EXIT_SUCCESS;
    }
};

inline sftpovw::SessionOptions validOptions() {
    sftpovw::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

inline bool connectMock(sftpovw::MockSftpSession &s) {
    std::string err;
    return s.connect(validOptions(), err);
}

inline std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

// Scratch directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string &tag) {
        path_ = std::filesystem::temp_directory_path() /
                ("sftpovw-" + tag + "-" + uniqueToken());
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
        ok_ = !ec;
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    bool ok() const { return ok_; }
    std::string file(const std::string &name) const {
        return (path_ / name).string();
    }
    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
    bool ok_ = false;
};

inline bool writeFile(const std::string &p, const std::string &content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return false;
    out << content;
    return static_cast<bool>(out);
}

inline bool readFile(const std::string &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

inline std::size_t countEntries(const std::filesystem::path &dir) {
    std::size_t n = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end;
         !ec && it != end; it.increment(ec))
        ++n;
    return n;
}

} // namespace sftpovw_test
