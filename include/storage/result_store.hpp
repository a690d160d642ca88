// File: storage/result_store.hpp

#ifndef STORAGE_RESULT_STORE_HPP
#define STORAGE_RESULT_STORE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "types/comparison_result.hpp"

namespace storage {

    class NotFoundError final : public std::runtime_error {
    public:
        explicit NotFoundError(const std::string &id) : std::runtime_error("No result found for ID " + id), id_(id) {}

        [[nodiscard]] const std::string &id() const noexcept { return id_; }

    private:
        std::string id_;
    };

    // Keyed storage of finished comparison results. Implementations must be safe for concurrent use.
    class ResultStore {
    public:
        virtual ~ResultStore() = default;

        // Store a complete result (overlay attached) and return its generated identifier.
        [[nodiscard]] virtual std::string create(types::ComparisonResult result) = 0;

        // Throws NotFoundError for an unknown identifier.
        [[nodiscard]] virtual std::shared_ptr<const types::ComparisonResult> read(const std::string &id) const = 0;

        [[nodiscard]] virtual std::vector<std::string> readAll() const = 0;
    };

} // namespace storage

#endif // STORAGE_RESULT_STORE_HPP
