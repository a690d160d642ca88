// File: types/strategy_type.cpp

#include "types/strategy_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "common/logging/logger.hpp"
#include "processing/image/errors.hpp"

namespace types {

    namespace {
        constexpr std::array<std::pair<ComparisonType, std::string_view>, 2> comparison_names{
                {{ComparisonType::Pixel, "pixel"}, {ComparisonType::Structural, "structural"}}};

        constexpr std::array<std::pair<VisualisationType, std::string_view>, 2> visualisation_names{
                {{VisualisationType::Heatmap, "heatmap"}, {VisualisationType::Contour, "contour"}}};

        // Spelling accepted by earlier clients of the comparison endpoint.
        constexpr std::string_view legacy_structural_name = "structual";

        std::string normalize(const std::string_view name) {
            std::string lowered(name);
            std::ranges::transform(lowered, lowered.begin(), [](const unsigned char c) { return std::tolower(c); });
            return lowered;
        }

        template<typename Enum, std::size_t N>
        std::string_view nameOf(const std::array<std::pair<Enum, std::string_view>, N> &table, const Enum value) {
            const auto it = std::ranges::find(table, value, &std::pair<Enum, std::string_view>::first);
            return it != table.end() ? it->second : std::string_view{"unknown"};
        }

        template<typename Enum, std::size_t N>
        std::vector<std::string> namesOf(const std::array<std::pair<Enum, std::string_view>, N> &table) {
            std::vector<std::string> names;
            names.reserve(N);
            for (const auto &[value, name]: table) {
                names.emplace_back(name);
            }
            return names;
        }
    } // namespace

    std::string_view toString(const ComparisonType type) noexcept { return nameOf(comparison_names, type); }

    std::string_view toString(const VisualisationType type) noexcept { return nameOf(visualisation_names, type); }

    ComparisonType parseComparisonType(const std::string_view name) {
        const auto lowered = normalize(name);
        if (lowered == legacy_structural_name) {
            return ComparisonType::Structural;
        }
        for (const auto &[value, candidate]: comparison_names) {
            if (candidate == lowered) {
                return value;
            }
        }
        LOG_WARN("Rejecting unknown comparison type '{}'.", name);
        throw processing::image::UnknownStrategyError(fmt::format("Invalid comparison type requested: '{}'", name));
    }

    VisualisationType parseVisualisationType(const std::string_view name) {
        const auto lowered = normalize(name);
        for (const auto &[value, candidate]: visualisation_names) {
            if (candidate == lowered) {
                return value;
            }
        }
        LOG_WARN("Rejecting unknown visualisation type '{}'.", name);
        throw processing::image::UnknownStrategyError(
                fmt::format("Invalid visualisation type requested: '{}'", name));
    }

    std::vector<std::string> comparisonTypeNames() { return namesOf(comparison_names); }

    std::vector<std::string> visualisationTypeNames() { return namesOf(visualisation_names); }

} // namespace types
