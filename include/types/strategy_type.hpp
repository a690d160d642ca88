// File: types/strategy_type.hpp

#ifndef TYPES_STRATEGY_TYPE_HPP
#define TYPES_STRATEGY_TYPE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace types {

    enum class ComparisonType { Pixel, Structural };

    enum class VisualisationType { Heatmap, Contour };

    [[nodiscard]] std::string_view toString(ComparisonType type) noexcept;
    [[nodiscard]] std::string_view toString(VisualisationType type) noexcept;

    // Case-insensitive. Throws processing::image::UnknownStrategyError for anything outside the set.
    [[nodiscard]] ComparisonType parseComparisonType(std::string_view name);
    [[nodiscard]] VisualisationType parseVisualisationType(std::string_view name);

    // Canonical names, in declaration order, for discovery menus.
    [[nodiscard]] std::vector<std::string> comparisonTypeNames();
    [[nodiscard]] std::vector<std::string> visualisationTypeNames();

} // namespace types

#endif // TYPES_STRATEGY_TYPE_HPP
