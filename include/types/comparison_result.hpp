// File: include/types/comparison_result.hpp

#ifndef COMPARISON_RESULT_HPP
#define COMPARISON_RESULT_HPP

#include <opencv2/core.hpp>
#include <optional>
#include <stdexcept>
#include <vector>

namespace types {

    /*
     * Outcome of one comparison. Built in two stages: a comparator supplies the score and the
     * single-channel difference map, then a visualiser attaches the encoded overlay exactly once.
     * Score and map never change after construction.
     */
    class ComparisonResult {
    public:
        using Bytes = std::vector<uchar>;

        ComparisonResult(const double score, const cv::Mat &map) : score_(score), map_(map.clone()) {}

        [[nodiscard]] double score() const noexcept { return score_; }
        // Deep copy, the stored map is never shared.
        [[nodiscard]] cv::Mat map() const { return map_.clone(); }
        [[nodiscard]] const std::optional<Bytes> &visualisation() const noexcept { return visualisation_; }

        // True once the overlay has been attached; only complete results may be persisted.
        [[nodiscard]] bool isComplete() const noexcept { return visualisation_.has_value(); }

        void attachVisualisation(Bytes encoded) {
            if (visualisation_) {
                throw std::logic_error("Visualisation already attached to this comparison result");
            }
            visualisation_ = std::move(encoded);
        }

    private:
        double score_;
        cv::Mat map_;
        std::optional<Bytes> visualisation_;
    };

} // namespace types

#endif // COMPARISON_RESULT_HPP
