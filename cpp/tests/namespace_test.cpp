#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "vb9/ns/namespace.hpp"

using namespace std::chrono_literals;

TEST(Namespace, WriteReadNormalizes) {
    vb9::ns::Namespace ns;
    ns.write("//form//source.scm/", std::string("(a)"));
    EXPECT_TRUE(ns.exists("/form/source.scm"));
    EXPECT_TRUE(ns.exists("form/source.scm"));
    ASSERT_TRUE(ns.read_text("/form/source.scm").has_value());
    EXPECT_EQ(*ns.read_text("/form/source.scm"), "(a)");
}

TEST(Namespace, MissingReadIsAbsent) {
    vb9::ns::Namespace ns;
    EXPECT_FALSE(ns.read("/nope").has_value());
    EXPECT_FALSE(ns.read_text("/nope").has_value());
    EXPECT_FALSE(ns.exists("/nope"));
}

TEST(Namespace, LastWriteWinsAcrossKinds) {
    vb9::ns::Namespace ns;
    ns.write("/k", vb9::ns::Blob{1, 2, 3});
    EXPECT_FALSE(ns.read_text("/k").has_value());
    auto v = ns.read("/k");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(std::get<vb9::ns::Blob>(*v), (vb9::ns::Blob{1, 2, 3}));

    ns.write("/k", std::string("text"));
    EXPECT_EQ(*ns.read_text("/k"), "text");
}

TEST(Namespace, PathsSorted) {
    vb9::ns::Namespace ns;
    ns.write("/b", std::string("1"));
    ns.write("/a/c", std::string("2"));
    ns.write("a", std::string("3"));
    const std::vector<std::string> expected = {"/a", "/a/c", "/b"};
    EXPECT_EQ(ns.paths(), expected);
}

TEST(Namespace, MountsAreAdvisory) {
    vb9::ns::Namespace ns;
    ns.mount("/form", "/mnt/app/");
    ASSERT_TRUE(ns.mount_source("/mnt/app").has_value());
    EXPECT_EQ(*ns.mount_source("mnt/app"), "/form");

    ns.write("/form/x", std::string("1"));
    EXPECT_FALSE(ns.exists("/mnt/app/x"));

    ns.mount("/other", "/mnt/app");
    ASSERT_EQ(ns.mounts().size(), 1u);
    EXPECT_EQ(ns.mounts()[0].source, "/other");
    EXPECT_FALSE(ns.mount_source("/mnt/none").has_value());
}

TEST(Namespace, QueueIsFifo) {
    vb9::ns::Namespace ns;
    ns.enqueue("one");
    ns.enqueue("two");
    ns.enqueue("three");
    EXPECT_EQ(ns.pending(), 3u);
    EXPECT_EQ(ns.dequeue(10ms).value_or(""), "one");
    EXPECT_EQ(ns.dequeue(10ms).value_or(""), "two");
    EXPECT_EQ(ns.dequeue(10ms).value_or(""), "three");
    EXPECT_EQ(ns.pending(), 0u);
}

TEST(Namespace, DequeueTimesOut) {
    vb9::ns::Namespace ns;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ns.dequeue(50ms).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 2s);
}

TEST(Namespace, DequeueWakesOnEnqueue) {
    vb9::ns::Namespace ns;
    std::thread producer([&ns] {
        std::this_thread::sleep_for(20ms);
        ns.enqueue("late");
    });
    auto msg = ns.dequeue(5s);
    producer.join();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, "late");
}

TEST(Namespace, ConcurrentProducersKeepPerProducerOrder) {
    vb9::ns::Namespace ns;
    constexpr int kPerProducer = 500;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&ns, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                ns.enqueue(std::to_string(p) + ":" + std::to_string(i));
                ns.write("/p" + std::to_string(p), std::to_string(i));
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    std::vector<int> last(4, -1);
    int total = 0;
    while (auto msg = ns.dequeue(1ms)) {
        const auto colon = msg->find(':');
        const int p = std::stoi(msg->substr(0, colon));
        const int i = std::stoi(msg->substr(colon + 1));
        EXPECT_GT(i, last[p]);
        last[p] = i;
        ++total;
    }
    EXPECT_EQ(total, 4 * kPerProducer);
    for (int p = 0; p < 4; ++p) {
        EXPECT_EQ(*ns.read_text("/p" + std::to_string(p)), std::to_string(kPerProducer - 1));
    }
}

TEST(Namespace, EventLog) {
    vb9::ns::Namespace ns;
    ns.log("a", "1");
    ns.log("b", "2");
    ns.log("c", "3");
    EXPECT_EQ(ns.event_count(), 3u);

    const auto all = ns.events();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].kind, "a");
    EXPECT_EQ(all[2].detail, "3");

    const auto tail = ns.events_since(1);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].kind, "b");
    EXPECT_TRUE(ns.events_since(3).empty());
    EXPECT_TRUE(ns.events_since(99).empty());
}
