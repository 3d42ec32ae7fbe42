#ifndef HUIMINER_HPP
#define HUIMINER_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "uptree.hpp"

struct HighUtilityItemset {
    std::set<Item> items;
    double utility;
    int support;

    // itemsets are identified by their items
    bool operator<(const HighUtilityItemset& other) const { return items < other.items; }
};

bool operator==(const HighUtilityItemset&, const HighUtilityItemset&);
bool operator!=(const HighUtilityItemset&, const HighUtilityItemset&);

enum class StopReason { none, itemset_limit, time_limit };

std::string to_string(StopReason);

struct MiningOptions {
    double min_utility;
    std::size_t max_itemsets;       // 0 for no limit
    std::size_t max_length;         // 0 for no limit
    int max_threads;
    double time_limit_seconds;      // 0 for no limit

    MiningOptions() :
        min_utility( 0 ), max_itemsets( 0 ), max_length( 0 ), max_threads( 1 ), time_limit_seconds( 0 ) {}
    explicit MiningOptions(double min_utility) :
        min_utility( min_utility ), max_itemsets( 0 ), max_length( 0 ), max_threads( 1 ), time_limit_seconds( 0 ) {}

    void validate() const;
};

struct MiningStatistics {
    std::size_t candidates;
    std::size_t pruned;
    std::size_t projections;

    MiningStatistics() : candidates( 0 ), pruned( 0 ), projections( 0 ) {}
};

struct MiningResult {
    std::set<HighUtilityItemset> itemsets;
    bool complete;
    StopReason stop_reason;
    MiningStatistics statistics;

    MiningResult() : itemsets(), complete( true ), stop_reason( StopReason::none ), statistics() {}
};

// One path of a conditional pattern base: the items that may still extend the
// prefix (root side first), their utilities, and the prefix utility, all
// summed over the `count` transactions the path stands for.
struct ProjectedPath {
    std::vector<Item> items;
    std::vector<double> utilities;
    double prefix_utility;
    int count;
};

using ProjectedDatabase = std::vector<ProjectedPath>;

// conditional pattern base of a single item, read off its node-link chain
ProjectedDatabase project_tree(const UPTree&, const Item&);
// conditional pattern base of prefix + item, derived from the base of prefix
ProjectedDatabase project(const ProjectedDatabase&, const Item&);

double total_utility(const ProjectedDatabase&);
double potential_utility(const ProjectedDatabase&);
int support(const ProjectedDatabase&);

MiningResult mine(const UPTree&, const MiningOptions&);
MiningResult mine(const UPTree&, double min_utility);

#endif  // HUIMINER_HPP
