#include <gtest/gtest.h>

#include <thread>

#include "infrastructure/atomic_file.hpp"
#include "test_support.hpp"

using namespace aprotate;
using aprotate::infrastructure::read_file;
using aprotate::infrastructure::write_file_atomic;

TEST(AtomicFileTest, WritesContentWithExactMode)
{
    test::TempDir dir;
    const auto path = dir / "current-wlan0.json";

    std::string error;
    ASSERT_TRUE(write_file_atomic(path, "{\"ssid\":\"ssb-abc123\"}", 0600, &error)) << error;

    std::string content;
    ASSERT_TRUE(read_file(path, content));
    EXPECT_EQ(content, "{\"ssid\":\"ssb-abc123\"}");
    EXPECT_EQ(test::permissions_of(path),
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
}

TEST(AtomicFileTest, MissingDirectoryIsReported)
{
    test::TempDir dir;
    std::string error;
    EXPECT_FALSE(write_file_atomic(dir / "absent" / "status-wlan0.json", "{}", 0644, &error));
    EXPECT_FALSE(error.empty());
}

TEST(AtomicFileTest, ConcurrentWritersOfOneFileNeverLoseOrTearSnapshots)
{
    test::TempDir dir;
    const auto path = dir / "status-wlan0.json";
    const std::string first(512, 'a');
    const std::string second(512, 'b');
    ASSERT_TRUE(write_file_atomic(path, first, 0644));

    constexpr int writes_per_thread = 2000;
    std::atomic<int> failed{0};
    std::atomic<int> torn{0};
    std::atomic<bool> writing{true};

    auto writer = [&](const std::string &content) {
        for (int i = 0; i < writes_per_thread; ++i)
        {
            if (!write_file_atomic(path, content, 0644))
            {
                failed++;
            }
        }
    };

    std::thread reader([&]() {
        while (writing)
        {
            std::string content;
            if (read_file(path, content) && content != first && content != second)
            {
                torn++;
            }
        }
    });
    std::thread a(writer, first);
    std::thread b(writer, second);
    a.join();
    b.join();
    writing = false;
    reader.join();

    EXPECT_EQ(failed.load(), 0);
    EXPECT_EQ(torn.load(), 0);

    int leftovers = 0;
    for (const auto &entry : std::filesystem::directory_iterator(dir.path()))
    {
        if (entry.path() != path)
        {
            leftovers++;
        }
    }
    EXPECT_EQ(leftovers, 0);
}
