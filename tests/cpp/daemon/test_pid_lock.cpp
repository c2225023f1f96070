#include "daemon/lifecycle/pid_lock.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;
using zonelink::lifecycle::PidLock;

class PidLockTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? std::string(info->name()) : "pid_lock";
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("zonelink_pid_lock_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }
};

TEST_F(PidLockTest, AcquireWritesPidAndReleaseRemovesFile) {
    fs::path lockPath = tempDir / "zonelink.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());
    EXPECT_TRUE(fs::exists(lockPath));
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
    EXPECT_EQ(lock->path(), lockPath.string());

    lock.reset();
    EXPECT_FALSE(fs::exists(lockPath));
}

TEST_F(PidLockTest, SecondProcessCannotAcquireWhileLocked) {
    fs::path lockPath = tempDir / "zonelink.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());

    pid_t pid = fork();
    ASSERT_GE(pid, 0);

    if (pid == 0) {
        auto second = PidLock::tryAcquire(lockPath.string());
        _exit(second.has_value() ? 1 : 0);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    // Still ours after the failed attempt
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
}

TEST_F(PidLockTest, StaleFileWithoutLockIsTakenOver) {
    fs::path lockPath = tempDir / "zonelink.pid";
    {
        std::ofstream stale(lockPath);
        stale << "999999\n";
    }

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());
    EXPECT_EQ(PidLock::readOwner(lockPath.string()), getpid());
}

TEST_F(PidLockTest, MoveTransfersOwnership) {
    fs::path lockPath = tempDir / "zonelink.pid";

    auto lock = PidLock::tryAcquire(lockPath.string());
    ASSERT_TRUE(lock.has_value());

    PidLock moved = std::move(*lock);
    lock.reset();
    EXPECT_TRUE(fs::exists(lockPath));
    EXPECT_EQ(moved.path(), lockPath.string());
}

TEST_F(PidLockTest, UnwritableDirectoryFails) {
    auto lock = PidLock::tryAcquire((tempDir / "missing" / "zonelink.pid").string());
    EXPECT_FALSE(lock.has_value());
    EXPECT_EQ(PidLock::readOwner((tempDir / "missing" / "zonelink.pid").string()), 0);
}
