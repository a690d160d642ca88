// File: storage/in_memory_result_store.cpp

#include "storage/in_memory_result_store.hpp"

#include <fmt/format.h>

#include "common/logging/logger.hpp"

namespace storage {

    InMemoryResultStore::InMemoryResultStore() : generator_(std::random_device{}()) {}

    std::string InMemoryResultStore::create(types::ComparisonResult result) {
        if (!result.isComplete()) {
            LOG_ERROR("Refusing to store a comparison result without a visualisation.");
            throw std::invalid_argument("Only complete comparison results can be stored");
        }

        std::shared_ptr<const types::ComparisonResult> stored =
                std::make_shared<types::ComparisonResult>(std::move(result));

        std::lock_guard lock(mutex_);
        std::string id;
        do {
            id = generateId();
        } while (results_.contains(id));
        results_.emplace(id, std::move(stored));

        LOG_DEBUG("Stored comparison result {} ({} total).", id, results_.size());
        return id;
    }

    std::shared_ptr<const types::ComparisonResult> InMemoryResultStore::read(const std::string &id) const {
        std::lock_guard lock(mutex_);
        const auto it = results_.find(id);
        if (it == results_.end()) {
            throw NotFoundError(id);
        }
        return it->second;
    }

    std::vector<std::string> InMemoryResultStore::readAll() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(results_.size());
        for (const auto &[id, result]: results_) {
            ids.push_back(id);
        }
        return ids;
    }

    std::size_t InMemoryResultStore::size() const {
        std::lock_guard lock(mutex_);
        return results_.size();
    }

    std::string InMemoryResultStore::generateId() {
        std::uniform_int_distribution<std::uint64_t> distribution;
        std::uint64_t high = distribution(generator_);
        std::uint64_t low = distribution(generator_);

        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

        return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF,
                           low >> 48, low & 0xFFFFFFFFFFFFULL);
    }

} // namespace storage
