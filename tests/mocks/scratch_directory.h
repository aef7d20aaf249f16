#pragma once
/**
 * Per-test directory under ::testing::TempDir(), removed with its contents on destruction.
 */

#include <dirent.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <string>
#include <vector>

namespace nvmestas {
namespace engine {
namespace testing {

class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& prefix) {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = ::testing::TempDir() + prefix + "_" + (info ? info->name() : "none") + "_" +
                std::to_string(::getpid());
        remove_tree(path_);
    }

    ~ScratchDirectory() { remove_tree(path_); }

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::string& path() const { return path_; }

    static void remove_tree(const std::string& directory) {
        DIR* dir = opendir(directory.c_str());
        if (!dir) {
            return;
        }
        std::vector<std::string> names;
        while (auto* entry = readdir(dir)) {
            const std::string name(entry->d_name);
            if (name != "." && name != "..") {
                names.push_back(name);
            }
        }
        closedir(dir);
        for (const auto& name : names) {
            const std::string path = directory + "/" + name;
            if (unlink(path.c_str()) != 0) {
                remove_tree(path);
            }
        }
        rmdir(directory.c_str());
    }

private:
    std::string path_;
};

} // namespace testing
} // namespace engine
} // namespace nvmestas
