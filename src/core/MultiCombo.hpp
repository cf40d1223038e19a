#ifndef TRACTORENGINE_MULTICOMBO_HPP
#define TRACTORENGINE_MULTICOMBO_HPP

#include <optional>
#include <span>
#include <vector>
#include "Combo.hpp"
#include "Types.hpp"

namespace tractor::core
{
    // Structure of a card set after decomposition into straight combos.
    struct MultiCombo
    {
        // nullopt is the trump group
        std::optional<Suit> suit{};
        std::vector<Combo> combos;

        size_t total_length{};
        // standalone pairs plus the pairs inside tractors
        size_t total_pairs{};
        size_t total_tractor_pairs{};
        size_t tractors{};
        // pairs per tractor, descending
        std::vector<size_t> tractor_sizes;
        bool is_trump{false};

        [[nodiscard]]
        auto Singles() const noexcept -> size_t { return total_length - 2 * total_pairs; }
    };

    // Non-overlapping decomposition: maximal tractor runs, then the remaining
    // pairs, then singles. Components are ordered tractors, pairs, singles,
    // strongest first within each kind.
    auto DecomposeCombos(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>;

    auto SummarizeCombos(std::vector<Combo> combos, TrumpInfo const& trump) -> MultiCombo;
    auto AnalyzeComboStructure(std::span<Card const> cards, TrumpInfo const& trump) -> MultiCombo;

    // Two or more plain cards of one suit that split into two or more components.
    auto DetectLeadingMultiCombo(std::span<Card const> cards, TrumpInfo const& trump) -> std::optional<MultiCombo>;

    // Most tractor pairs that fit into max_pairs pair slots, each tractor
    // contributing nothing or a sub-run of at least two pairs.
    auto AchievableTractorPairs(std::span<size_t const> tractor_sizes, size_t max_pairs) -> size_t;
}

#endif //TRACTORENGINE_MULTICOMBO_HPP
