#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        std::random_device device;
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("reride_test_" + std::to_string(device()) + "_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir_);

        Logger::info("TestBase SetUp completed for test: " +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        if (ec)
        {
            Logger::warn("Could not remove test directory " + test_dir_.string() + ": " + ec.message());
        }

        Logger::info("TestBase TearDown completed for test: " +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    }

    // Helper to create a file under the scratch directory
    std::filesystem::path createFile(const std::string &relative, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_dir_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path;
    }

    const std::filesystem::path &testDir() const { return test_dir_; }

private:
    std::filesystem::path test_dir_;
};
