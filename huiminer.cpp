#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <omp.h>

#include "huiminer.hpp"

using namespace std;

bool operator==(const HighUtilityItemset& lhs, const HighUtilityItemset& rhs)
{
    return lhs.items == rhs.items && lhs.utility == rhs.utility && lhs.support == rhs.support;
}

bool operator!=(const HighUtilityItemset& lhs, const HighUtilityItemset& rhs)
{
    return !( lhs == rhs );
}

string to_string(StopReason reason)
{
    switch ( reason ) {
        case StopReason::none:
            return "none";
        case StopReason::itemset_limit:
            return "itemset limit";
        case StopReason::time_limit:
            return "time limit";
    }
    return "unknown";
}

void MiningOptions::validate() const
{
    if ( !std::isfinite( min_utility ) || min_utility < 0 ) {
        throw ConfigError( "minimum utility must be a non-negative number" );
    }
    if ( max_threads < 1 ) {
        throw ConfigError( "number of threads must be at least 1" );
    }
    if ( !std::isfinite( time_limit_seconds ) || time_limit_seconds < 0 ) {
        throw ConfigError( "time limit must be a non-negative number of seconds" );
    }
}

ProjectedDatabase project_tree(const UPTree& uptree, const Item& item)
{
    ProjectedDatabase conditional_pattern_base;

    const auto entry = uptree.header_table().find( item );
    if ( entry == uptree.header_table().end() ) { return conditional_pattern_base; }

    // for each node of the item, follow the node links
    auto path_starting_upnode = entry->second.first_node.lock();
    while ( path_starting_upnode ) {
        ProjectedPath path{ {}, path_starting_upnode->path_utility, path_starting_upnode->utility, path_starting_upnode->count };

        auto curr_path_upnode = path_starting_upnode->parent.lock();
        while ( curr_path_upnode && !curr_path_upnode->is_root() ) {
            path.items.push_back( curr_path_upnode->item );
            curr_path_upnode = curr_path_upnode->parent.lock();
        }
        reverse( path.items.begin(), path.items.end() );
        conditional_pattern_base.push_back( std::move( path ) );

        path_starting_upnode = path_starting_upnode->node_link.lock();
    }
    return conditional_pattern_base;
}

ProjectedDatabase project(const ProjectedDatabase& source, const Item& item)
{
    ProjectedDatabase projected;
    map<vector<Item>, size_t> position_by_items;

    for ( const ProjectedPath& path : source ) {
        const auto it = find( path.items.cbegin(), path.items.cend(), item );
        if ( it == path.items.cend() ) { continue; }
        const size_t position = it - path.items.cbegin();

        // only the items above the projected one may still extend the prefix
        vector<Item> items( path.items.cbegin(), it );
        const double prefix_utility = path.prefix_utility + path.utilities[position];

        const auto merged = position_by_items.find( items );
        if ( merged == position_by_items.end() ) {
            position_by_items[items] = projected.size();
            projected.push_back( ProjectedPath{ std::move( items ),
                vector<double>( path.utilities.cbegin(), path.utilities.cbegin() + position ),
                prefix_utility, path.count } );
        }
        else {
            ProjectedPath& target = projected[merged->second];
            for ( size_t i = 0; i < position; i++ ) {
                target.utilities[i] += path.utilities[i];
            }
            target.prefix_utility += prefix_utility;
            target.count += path.count;
        }
    }
    return projected;
}

double total_utility(const ProjectedDatabase& projected)
{
    double utility = 0;
    for ( const ProjectedPath& path : projected ) {
        utility += path.prefix_utility;
    }
    return utility;
}

double potential_utility(const ProjectedDatabase& projected)
{
    double utility = 0;
    for ( const ProjectedPath& path : projected ) {
        utility += path.prefix_utility;
        for ( double item_utility : path.utilities ) {
            utility += item_utility;
        }
    }
    return utility;
}

int support(const ProjectedDatabase& projected)
{
    int count = 0;
    for ( const ProjectedPath& path : projected ) {
        count += path.count;
    }
    return count;
}

namespace {

using Clock = chrono::steady_clock;

struct LocalHeaderEntry {
    double utility;
    double potential_utility;
    int support;

    LocalHeaderEntry() : utility( 0 ), potential_utility( 0 ), support( 0 ) {}
};

map<Item, LocalHeaderEntry> build_local_header(const ProjectedDatabase& projected)
{
    map<Item, LocalHeaderEntry> local_header;
    for ( const ProjectedPath& path : projected ) {
        double path_utility = path.prefix_utility;
        for ( size_t i = 0; i < path.items.size(); i++ ) {
            path_utility += path.utilities[i];

            LocalHeaderEntry& entry = local_header[path.items[i]];
            entry.utility += path.prefix_utility + path.utilities[i];
            entry.potential_utility += path_utility;
            entry.support += path.count;
        }
    }
    return local_header;
}

// Mines every itemset whose least useful item (in processing order) is one
// top-level item. Branches share nothing but the read-only tree.
class BranchMiner {
public:
    BranchMiner(const MiningOptions& options, size_t capacity, const Clock::time_point* deadline) :
        itemsets(), stop_reason( StopReason::none ), statistics(),
        options( options ), capacity( capacity ), deadline( deadline )
    {
    }

    void mine_item(const UPTree& uptree, const Item& item, const HeaderEntry& entry)
    {
        if ( stopped() ) { return; }

        ++statistics.candidates;
        if ( entry.potential_utility < options.min_utility ) {
            ++statistics.pruned;
            return;
        }

        const ProjectedDatabase conditional_pattern_base = project_tree( uptree, item );
        ++statistics.projections;

        const vector<Item> prefix{ item };
        const double utility = total_utility( conditional_pattern_base );
        if ( utility >= options.min_utility && !emit( prefix, utility, support( conditional_pattern_base ) ) ) {
            return;
        }
        if ( can_extend( prefix ) ) {
            grow( prefix, conditional_pattern_base );
        }
    }

    vector<HighUtilityItemset> itemsets;
    StopReason stop_reason;
    MiningStatistics statistics;

private:
    void grow(const vector<Item>& prefix, const ProjectedDatabase& projected)
    {
        const map<Item, LocalHeaderEntry> local_header = build_local_header( projected );

        // ascending utility keeps the early projections small
        vector<pair<Item, LocalHeaderEntry>> local_items( local_header.cbegin(), local_header.cend() );
        sort( local_items.begin(), local_items.end(), [](const pair<Item, LocalHeaderEntry>& lhs, const pair<Item, LocalHeaderEntry>& rhs) {
            return std::tie(lhs.second.utility, lhs.first) < std::tie(rhs.second.utility, rhs.first);
        } );

        for ( const auto& local_item : local_items ) {
            if ( stopped() ) { return; }

            const LocalHeaderEntry& entry = local_item.second;
            ++statistics.candidates;
            if ( entry.potential_utility < options.min_utility ) {
                ++statistics.pruned;
                continue;
            }

            vector<Item> extended( prefix );
            extended.push_back( local_item.first );

            if ( entry.utility >= options.min_utility && !emit( extended, entry.utility, entry.support ) ) {
                return;
            }
            if ( !can_extend( extended ) ) { continue; }

            const ProjectedDatabase conditional_pattern_base = project( projected, local_item.first );
            ++statistics.projections;
            grow( extended, conditional_pattern_base );
        }
    }

    bool emit(const vector<Item>& items, double utility, int count)
    {
        if ( itemsets.size() >= capacity ) {
            stop_reason = StopReason::itemset_limit;
            return false;
        }
        HighUtilityItemset itemset;
        itemset.items.insert( items.cbegin(), items.cend() );
        itemset.utility = utility;
        itemset.support = count;
        itemsets.push_back( std::move( itemset ) );
        return true;
    }

    bool can_extend(const vector<Item>& prefix) const
    {
        return options.max_length == 0 || prefix.size() < options.max_length;
    }

    bool stopped()
    {
        if ( stop_reason != StopReason::none ) { return true; }
        if ( deadline && Clock::now() >= *deadline ) {
            stop_reason = StopReason::time_limit;
            return true;
        }
        return false;
    }

    const MiningOptions& options;
    size_t capacity;
    const Clock::time_point* deadline;
};

}  // namespace

MiningResult mine(const UPTree& uptree, const MiningOptions& options)
{
    options.validate();
    if ( !uptree.complete_for( options.min_utility ) ) {
        throw ConfigError( "minimum utility " + std::to_string( options.min_utility )
            + " is below the TWU of items pruned while building the tree; rebuild with a lower pruning threshold" );
    }

    MiningResult result;
    if ( uptree.empty() ) { return result; }

    // order items by ascending total utility
    vector<pair<Item, const HeaderEntry*>> items;
    for ( const auto& entry : uptree.header_table() ) {
        items.push_back( make_pair( entry.first, &entry.second ) );
    }
    sort( items.begin(), items.end(), [](const pair<Item, const HeaderEntry*>& lhs, const pair<Item, const HeaderEntry*>& rhs) {
        return std::tie(lhs.second->total_utility, lhs.first) < std::tie(rhs.second->total_utility, rhs.first);
    } );

    Clock::time_point deadline_point;
    const Clock::time_point* deadline = nullptr;
    if ( options.time_limit_seconds > 0 ) {
        // a limit past the end of the clock's range means no deadline
        const Clock::time_point now = Clock::now();
        const Clock::duration headroom = Clock::time_point::max() - now;
        if ( options.time_limit_seconds < chrono::duration<double>( headroom ).count() ) {
            const Clock::duration time_limit = chrono::duration_cast<Clock::duration>( chrono::duration<double>( options.time_limit_seconds ) );
            if ( time_limit < headroom ) {
                deadline_point = now + time_limit;
                deadline = &deadline_point;
            }
        }
    }

    const size_t limit = options.max_itemsets == 0 ? numeric_limits<size_t>::max() : options.max_itemsets;
    vector<BranchMiner> branches;
    branches.reserve( items.size() );

    if ( options.max_threads > 1 ) {
        // every branch may fill the whole result; the ordered merge below truncates
        for ( size_t j = 0; j < items.size(); j++ ) {
            branches.push_back( BranchMiner( options, limit, deadline ) );
        }
        int i = 0;
        const int number_of_items = int( items.size() );
        #pragma omp parallel default(shared) private(i) num_threads(options.max_threads)
        {
            #pragma omp for schedule(dynamic)
            for ( i = 0; i < number_of_items; i++ ) {
                branches[i].mine_item( uptree, items[i].first, *items[i].second );
            }
        }
    }
    else {
        size_t found = 0;
        for ( const auto& item : items ) {
            branches.push_back( BranchMiner( options, limit - found, deadline ) );
            BranchMiner& branch = branches.back();
            branch.mine_item( uptree, item.first, *item.second );
            found += branch.itemsets.size();
            if ( branch.stop_reason != StopReason::none ) { break; }
        }
    }

    // join the branches in processing order
    for ( const BranchMiner& branch : branches ) {
        result.statistics.candidates += branch.statistics.candidates;
        result.statistics.pruned += branch.statistics.pruned;
        result.statistics.projections += branch.statistics.projections;
    }
    for ( const BranchMiner& branch : branches ) {
        for ( const HighUtilityItemset& itemset : branch.itemsets ) {
            if ( result.itemsets.size() >= limit ) {
                result.stop_reason = StopReason::itemset_limit;
                break;
            }
            result.itemsets.insert( itemset );
        }
        if ( result.stop_reason == StopReason::none ) {
            result.stop_reason = branch.stop_reason;
        }
        if ( result.stop_reason != StopReason::none ) { break; }
    }
    result.complete = result.stop_reason == StopReason::none;
    return result;
}

MiningResult mine(const UPTree& uptree, double min_utility)
{
    return mine( uptree, MiningOptions( min_utility ) );
}
