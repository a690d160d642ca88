// File: api/comparison_service.hpp

#ifndef API_COMPARISON_SERVICE_HPP
#define API_COMPARISON_SERVICE_HPP

#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "processing/image/codec.hpp"
#include "processing/image/visualisation/options.hpp"
#include "storage/result_store.hpp"

namespace api {

    // Client-facing failure: a status code in HTTP terms and a categorised message without internals.
    class ApiError final : public std::runtime_error {
    public:
        ApiError(const int status, const std::string &detail) : std::runtime_error(detail), status_(status) {}

        [[nodiscard]] int status() const noexcept { return status_; }

        // {"detail": "..."}
        [[nodiscard]] Json::Value toJson() const;

    private:
        int status_;
    };

    struct CompareRequest {
        processing::image::Bytes before_image;
        processing::image::Bytes after_image;
        std::string comparison_type;
        std::string visualisation_type;
        int sensitivity = 0;
    };

    /*
     * Transport-independent request layer. Builds the strategies for each request, runs
     * compare -> visualise, and persists only complete results. Every failure surfaces as ApiError.
     */
    class ComparisonService {
    public:
        static constexpr int bad_request = 400;
        static constexpr int not_found = 404;
        static constexpr int internal_error = 500;

        explicit ComparisonService(std::shared_ptr<storage::ResultStore> store,
                                   processing::image::VisualiserOptions options = {});

        // Returns the identifier of the stored result.
        [[nodiscard]] std::string compare(const CompareRequest &request) const;

        // {"score": <float>, "image_data": "data:image/png;base64,..."}
        [[nodiscard]] Json::Value get(const std::string &id) const;

        // Identifiers of all stored results.
        [[nodiscard]] Json::Value list() const;

        [[nodiscard]] static Json::Value comparisonTypes();
        [[nodiscard]] static Json::Value visualisationTypes();
        [[nodiscard]] static Json::Value health();

    private:
        std::shared_ptr<storage::ResultStore> store_;
        processing::image::VisualiserOptions options_;
    };

} // namespace api

#endif // API_COMPARISON_SERVICE_HPP
