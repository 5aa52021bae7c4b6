#ifndef NETDECLUTTER_DECLUTTER_CATEGORY_MULTIPLIERS_HPP
#define NETDECLUTTER_DECLUTTER_CATEGORY_MULTIPLIERS_HPP

#include <network/network_node.hpp>
#include <array>

namespace netdeclutter {

// Force multipliers applied to one unordered pair of node categories.
struct PairMultipliers {
    double stiffness = 1.0;       // Spring constant factor
    double rest_length = 1.0;     // Spring equilibrium length factor
    double repulsion = 1.0;       // Pairwise repulsion strength factor
};

// Which boosts a category triggers when it is one end of a pair.
struct CategoryTraits {
    bool boosts_springs = false;    // Stiffer, shorter springs (printers)
    bool boosts_repulsion = false;  // Stronger repulsion (servers)
};

constexpr std::array<CategoryTraits, kNodeCategoryCount> kCategoryTraits = {{
    {false, true},   // Server
    {false, false},  // Client
    {true, false},   // Printer
}};

// Symmetric 3x3 lookup of PairMultipliers keyed by category pair.
class CategoryMultiplierTable {
public:
    // Identity table (every factor 1)
    CategoryMultiplierTable() = default;

    // Table derived from kCategoryTraits and the three boost values
    static CategoryMultiplierTable from_boosts(double spring_stiffness_boost,
                                               double spring_length_boost,
                                               double repulsion_boost) {
        CategoryMultiplierTable table;
        for (size_t a = 0; a < kNodeCategoryCount; ++a) {
            for (size_t b = 0; b < kNodeCategoryCount; ++b) {
                const auto& ta = kCategoryTraits[a];
                const auto& tb = kCategoryTraits[b];
                PairMultipliers& m = table.entries_[a][b];
                if (ta.boosts_springs || tb.boosts_springs) {
                    m.stiffness = spring_stiffness_boost;
                    m.rest_length = spring_length_boost;
                }
                if (ta.boosts_repulsion || tb.boosts_repulsion) {
                    m.repulsion = repulsion_boost;
                }
            }
        }
        return table;
    }

    const PairMultipliers& lookup(NodeCategory a, NodeCategory b) const {
        return entries_[category_index(a)][category_index(b)];
    }

    // Overrides one pair in both orders
    void set(NodeCategory a, NodeCategory b, const PairMultipliers& m) {
        entries_[category_index(a)][category_index(b)] = m;
        entries_[category_index(b)][category_index(a)] = m;
    }

private:
    std::array<std::array<PairMultipliers, kNodeCategoryCount>, kNodeCategoryCount> entries_{};
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_CATEGORY_MULTIPLIERS_HPP
