// ==============================================================================
// test_support.hpp - Общие средства тестов
// ==============================================================================
//
// TempDirTest: временный каталог на тест. Имя строится из имени набора,
// имени теста и PID, каталог удаляется в TearDown.
//
// ==============================================================================

#ifndef DDS_TEST_SUPPORT_HPP
#define DDS_TEST_SUPPORT_HPP

#include "dds/platform.hpp"
#include "dds/store.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#define DDS_TEST_GETPID _getpid
#else
#include <unistd.h>
#define DDS_TEST_GETPID getpid
#endif

namespace dds::test {

class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("dds_") + info->test_suite_name() + "_" + info->name() +
                           "_" + std::to_string(DDS_TEST_GETPID());
        for (auto& c : name) {
            if (c == '/' || c == '\\') {
                c = '_';
            }
        }
        root_ = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        // Каталоги без прав (тесты PermissionDenied) иначе не удалить
        for (auto it = std::filesystem::recursive_directory_iterator(
                 root_, std::filesystem::directory_options::skip_permission_denied, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code perm_ec;
            if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
                std::filesystem::permissions(it->path(), std::filesystem::perms::owner_all,
                                             std::filesystem::perm_options::add, perm_ec);
            }
        }
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    /// Создать каталог (с родителями) внутри временного
    std::filesystem::path make_dir(const std::string& rel) {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p);
        return p;
    }

    /// Создать файл с содержимым
    std::filesystem::path touch(const std::string& rel, const std::string& content = "x") {
        const auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    /// Новая база во временном каталоге
    std::unique_ptr<store::Database> open_db(const std::string& name = "cache.sqlite") {
        return store::Database::open(root_ / "db" / name);
    }

    /// Ключ пути в формате хранилища
    static std::string key(const std::filesystem::path& p) {
        return platform::path_to_utf8(platform::normalize(p));
    }

private:
    std::filesystem::path root_;
};

}  // namespace dds::test

#endif  // DDS_TEST_SUPPORT_HPP
