// File: tests/storage/in_memory_result_store_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <regex>
#include <set>
#include <thread>

#include "storage/in_memory_result_store.hpp"

using storage::InMemoryResultStore;
using types::ComparisonResult;

namespace {
    ComparisonResult completeResult(const double score) {
        ComparisonResult result(score, cv::Mat(4, 4, CV_8UC1, cv::Scalar(0)));
        result.attachVisualisation({0x89, 'P', 'N', 'G'});
        return result;
    }
} // namespace

TEST(InMemoryResultStoreTest, StoresAndReadsBack) {
    InMemoryResultStore store;
    const auto id = store.create(completeResult(42.5));

    const auto stored = store.read(id);
    ASSERT_NE(stored, nullptr);
    EXPECT_DOUBLE_EQ(stored->score(), 42.5);
    ASSERT_TRUE(stored->visualisation().has_value());
    EXPECT_EQ(stored->visualisation()->size(), 4u);
    EXPECT_EQ(store.size(), 1u);
}

TEST(InMemoryResultStoreTest, IdentifiersAreVersionFourUuids) {
    InMemoryResultStore store;
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    for (int i = 0; i < 20; ++i) {
        const auto id = store.create(completeResult(i));
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
    }
}

TEST(InMemoryResultStoreTest, ReadAllListsEveryIdentifier) {
    InMemoryResultStore store;
    EXPECT_TRUE(store.readAll().empty());

    const auto first = store.create(completeResult(1.0));
    const auto second = store.create(completeResult(2.0));

    EXPECT_THAT(store.readAll(), ::testing::UnorderedElementsAre(first, second));
}

TEST(InMemoryResultStoreTest, UnknownIdentifierIsNotFound) {
    InMemoryResultStore store;
    try {
        (void) store.read("not-a-real-id");
        FAIL() << "Expected NotFoundError";
    } catch (const storage::NotFoundError &e) {
        EXPECT_EQ(e.id(), "not-a-real-id");
        EXPECT_THAT(e.what(), ::testing::HasSubstr("not-a-real-id"));
    }
}

TEST(InMemoryResultStoreTest, IncompleteResultIsRejected) {
    InMemoryResultStore store;
    ComparisonResult incomplete(3.0, cv::Mat(2, 2, CV_8UC1, cv::Scalar(0)));

    EXPECT_THROW((void) store.create(std::move(incomplete)), std::invalid_argument);
    EXPECT_EQ(store.size(), 0u);
}

TEST(InMemoryResultStoreTest, ConcurrentCreatesYieldDistinctIdentifiers) {
    InMemoryResultStore store;
    constexpr int threads = 8;
    constexpr int per_thread = 50;

    std::vector<std::vector<std::string>> ids(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&store, &ids, t] {
            for (int i = 0; i < per_thread; ++i) {
                ids[t].push_back(store.create(completeResult(i)));
            }
        });
    }
    for (auto &worker: workers) {
        worker.join();
    }

    std::set<std::string> unique;
    for (const auto &batch: ids) {
        unique.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(threads * per_thread));
    EXPECT_EQ(store.size(), unique.size());
    for (const auto &id: unique) {
        EXPECT_NO_THROW((void) store.read(id));
    }
}
