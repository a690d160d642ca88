// File: storage/in_memory_result_store.hpp

#ifndef STORAGE_IN_MEMORY_RESULT_STORE_HPP
#define STORAGE_IN_MEMORY_RESULT_STORE_HPP

#include <mutex>
#include <random>
#include <unordered_map>

#include "storage/result_store.hpp"

namespace storage {

    // Process-local store: a single mutex guards the map and the identifier generator. Nothing survives a restart.
    class InMemoryResultStore final : public ResultStore {
    public:
        InMemoryResultStore();

        [[nodiscard]] std::string create(types::ComparisonResult result) override;
        [[nodiscard]] std::shared_ptr<const types::ComparisonResult> read(const std::string &id) const override;
        [[nodiscard]] std::vector<std::string> readAll() const override;

        [[nodiscard]] std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<const types::ComparisonResult>> results_;
        std::mt19937_64 generator_;

        // Random (version 4) UUID in canonical 8-4-4-4-12 form. Caller holds mutex_.
        [[nodiscard]] std::string generateId();
    };

} // namespace storage

#endif // STORAGE_IN_MEMORY_RESULT_STORE_HPP
