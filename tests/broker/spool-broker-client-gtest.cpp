#include "rangepart/broker/spool-broker-client.h"
#include "rangepart/core/errors.h"
#include "rangepart/test-utils/test-utils.h"
#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace rangepart;
using namespace rangepart::broker;

TEST(SpoolBrokerClient, WritesOneLinePerMessage)
{
    TempDir dir;
    auto path = dir.path() / "out" / "partitions.spool";
    std::vector<std::future<DeliveryReport>> reports;
    {
        SpoolBrokerClient client(path);
        for (int i = 0; i < 3; ++i)
        {
            auto promise = std::make_shared<std::promise<DeliveryReport>>();
            reports.push_back(promise->get_future());
            client.send(
                "file-partitions",
                "partition-" + std::to_string(i),
                R"({"partitionNumber":)" + std::to_string(i) + "}",
                [promise](DeliveryReport const& report) {
                    promise->set_value(report);
                });
        }
        client.close();
    }

    for (auto& report : reports)
    {
        EXPECT_TRUE(report.get().ok);
    }

    auto lines = split_lines(read_file(path));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "file-partitions\tpartition-0\t{\"partitionNumber\":0}");
    EXPECT_EQ(lines[2], "file-partitions\tpartition-2\t{\"partitionNumber\":2}");
}

TEST(SpoolBrokerClient, AppendsToExistingSpool)
{
    TempDir dir;
    auto path = dir.write_file("partitions.spool", "t\tk\t{}\n");
    {
        SpoolBrokerClient client(path);
        client.send("t", "k2", "{}", [](DeliveryReport const&) {});
    }
    EXPECT_EQ(split_lines(read_file(path)).size(), 2u);
}

TEST(SpoolBrokerClient, RejectsUnframeableMessages)
{
    TempDir dir;
    SpoolBrokerClient client(dir.path() / "partitions.spool");
    bool called = false;
    auto cb = [&called](DeliveryReport const&) { called = true; };

    EXPECT_THROW(client.send("topic", "a\tb", "{}", cb), BrokerError);
    EXPECT_THROW(client.send("top\nic", "k", "{}", cb), BrokerError);
    EXPECT_THROW(client.send("topic", "k", "{\n}", cb), BrokerError);
    client.close();
    EXPECT_FALSE(called);
}

TEST(SpoolBrokerClient, SendAfterCloseIsRejected)
{
    TempDir dir;
    SpoolBrokerClient client(dir.path() / "partitions.spool");
    client.close();
    EXPECT_THROW(
        client.send("topic", "k", "{}", [](DeliveryReport const&) {}),
        BrokerError);
}

TEST(SpoolBrokerClient, SendsRacingCloseAreDeliveredOrRejected)
{
    TempDir dir;
    auto path = dir.path() / "partitions.spool";
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> delivered{0};
    {
        SpoolBrokerClient client(path);
        std::vector<std::thread> senders;
        for (int t = 0; t < 4; ++t)
        {
            senders.emplace_back([&, t]() {
                for (int i = 0; i < 200; ++i)
                {
                    try
                    {
                        client.send(
                            "t",
                            "partition-" + std::to_string(t * 1000 + i),
                            "{}",
                            [&delivered](DeliveryReport const&) { ++delivered; });
                        ++accepted;
                    }
                    catch (const BrokerError&)
                    {
                        ++rejected;
                    }
                }
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        client.close();
        for (auto& sender : senders)
        {
            sender.join();
        }
    }

    EXPECT_EQ(accepted + rejected, 800);
    EXPECT_EQ(delivered.load(), accepted.load());
    EXPECT_EQ(split_lines(read_file(path)).size(), std::size_t(accepted.load()));
}

TEST(SpoolBrokerClient, UnopenableSpoolThrows)
{
    TempDir dir;
    // A directory cannot be opened as the spool file
    boost::filesystem::create_directories(dir.path() / "taken");
    EXPECT_THROW(SpoolBrokerClient(dir.path() / "taken"), BrokerError);
}
