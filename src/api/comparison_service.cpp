// File: api/comparison_service.cpp

#include "api/comparison_service.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "common/logging/logger.hpp"
#include "common/utilities/base64.hpp"
#include "processing/image/comparator.hpp"
#include "processing/image/visualiser.hpp"

namespace api {

    namespace {
        Json::Value toJsonArray(const std::vector<std::string> &values) {
            Json::Value array(Json::arrayValue);
            for (const auto &value: values) {
                array.append(value);
            }
            return array;
        }

        bool isBlank(const std::string &value) {
            return std::ranges::all_of(value, [](const unsigned char c) { return std::isspace(c); });
        }
    } // namespace

    Json::Value ApiError::toJson() const {
        Json::Value body(Json::objectValue);
        body["detail"] = what();
        return body;
    }

    ComparisonService::ComparisonService(std::shared_ptr<storage::ResultStore> store,
                                         processing::image::VisualiserOptions options) :
        store_(std::move(store)), options_(std::move(options)) {
        if (!store_) {
            throw std::invalid_argument("ComparisonService requires a result store");
        }
    }

    std::string ComparisonService::compare(const CompareRequest &request) const {
        using namespace processing::image;

        if (request.sensitivity < 0 || request.sensitivity > 100) {
            throw ApiError(bad_request, "Sensitivity must be between 0 and 100");
        }

        std::shared_ptr<ImageComparator> comparator;
        std::shared_ptr<ImageVisualiser> visualiser;
        try {
            comparator = ImageComparator::create(request.comparison_type, request.sensitivity);
            visualiser = ImageVisualiser::create(request.visualisation_type, options_);
        } catch (const UnknownStrategyError &e) {
            throw ApiError(bad_request, e.what());
        } catch (const std::invalid_argument &e) {
            LOG_ERROR("Failed to initialise comparison tools: {}", e.what());
            throw ApiError(internal_error, "Failed to initialise comparison tools");
        }

        if (request.before_image.empty() || request.after_image.empty()) {
            throw ApiError(bad_request, "Uploaded images cannot be empty");
        }

        std::optional<types::ComparisonResult> comparison;
        try {
            comparison.emplace(comparator->compare(request.before_image, request.after_image));
        } catch (const DecodeError &e) {
            LOG_WARN("Rejecting undecodable upload: {}", e.what());
            throw ApiError(bad_request, "Uploaded images could not be decoded");
        } catch (const ShapeMismatchError &e) {
            LOG_WARN("Rejecting comparison: {}", e.what());
            throw ApiError(bad_request, e.what());
        } catch (const ImageDiffError &e) {
            LOG_ERROR("Comparison failed: {}", e.what());
            throw ApiError(internal_error, "Failed to compare images");
        }

        try {
            comparison->attachVisualisation(visualiser->visualise(request.after_image, *comparison));
        } catch (const ImageDiffError &e) {
            LOG_ERROR("Visualisation failed: {}", e.what());
            throw ApiError(internal_error, "Failed to generate visualisation");
        }

        try {
            const auto id = store_->create(std::move(*comparison));
            LOG_INFO("Stored {} / {} comparison {} (sensitivity {}).", types::toString(comparator->type()),
                     types::toString(visualiser->type()), id, request.sensitivity);
            return id;
        } catch (const std::exception &e) {
            LOG_ERROR("Database error: {}", e.what());
            throw ApiError(internal_error, "Failed to save comparison result");
        }
    }

    Json::Value ComparisonService::get(const std::string &id) const {
        if (id.empty() || isBlank(id)) {
            throw ApiError(bad_request, "Comparison ID cannot be empty");
        }

        std::shared_ptr<const types::ComparisonResult> comparison;
        try {
            comparison = store_->read(id);
        } catch (const storage::NotFoundError &e) {
            throw ApiError(not_found, e.what());
        } catch (const std::exception &e) {
            LOG_ERROR("Database error retrieving comparison {}: {}", id, e.what());
            throw ApiError(internal_error, "Failed to retrieve comparison");
        }

        if (!comparison->visualisation() || comparison->visualisation()->empty()) {
            throw ApiError(internal_error, "Failed to generate visualisation for comparison, please try again.");
        }

        Json::Value body(Json::objectValue);
        body["score"] = comparison->score();
        body["image_data"] = common::utilities::toDataUri(*comparison->visualisation(), "image/png");
        return body;
    }

    Json::Value ComparisonService::list() const {
        try {
            return toJsonArray(store_->readAll());
        } catch (const std::exception &e) {
            LOG_ERROR("Failed to retrieve comparisons: {}", e.what());
            throw ApiError(internal_error, "Failed to retrieve comparisons");
        }
    }

    Json::Value ComparisonService::comparisonTypes() { return toJsonArray(types::comparisonTypeNames()); }

    Json::Value ComparisonService::visualisationTypes() { return toJsonArray(types::visualisationTypeNames()); }

    Json::Value ComparisonService::health() {
        Json::Value body(Json::objectValue);
        body["status"] = "ok";
        return body;
    }

} // namespace api
