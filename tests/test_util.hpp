#ifndef TEST_UTIL_HPP
#define TEST_UTIL_HPP

#include <cstddef>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "huiminer.hpp"
#include "uptree.hpp"

namespace test_util {

inline TransactionItem occurrence(const Item& item, int quantity, double utility)
{
    return TransactionItem{ item, quantity, utility };
}

// {a,1,10},{b,1,20} / {a,1,10},{c,1,5} / {b,1,20},{c,1,5}
inline std::vector<Transaction> small_store()
{
    return {
        { occurrence( "a", 1, 10 ), occurrence( "b", 1, 20 ) },
        { occurrence( "a", 1, 10 ), occurrence( "c", 1, 5 ) },
        { occurrence( "b", 1, 20 ), occurrence( "c", 1, 5 ) },
    };
}

inline ItemUtilityTable small_table()
{
    ItemUtilityTable table;
    table.set( "a", 10 );
    table.set( "b", 20 );
    table.set( "c", 5 );
    return table;
}

inline HighUtilityItemset itemset(const std::set<Item>& items, double utility, int support)
{
    HighUtilityItemset result;
    result.items = items;
    result.utility = utility;
    result.support = support;
    return result;
}

// Integer unit prices keep every sum exact. Item "h" is priced 0, so its
// occurrences never reach the tree.
inline std::vector<Transaction> random_store(unsigned seed, std::size_t transactions, std::size_t distinct_items)
{
    std::mt19937 rng( seed );
    std::uniform_int_distribution<int> quantity( 1, 5 );
    std::uniform_int_distribution<int> coin( 0, 2 );

    const std::vector<Item> items{ "a", "b", "c", "d", "e", "f", "g", "h" };
    const std::vector<int> prices{ 7, 3, 11, 1, 5, 2, 9, 0 };

    std::vector<Transaction> store;
    while ( store.size() < transactions ) {
        Transaction transaction;
        for ( std::size_t i = 0; i < distinct_items && i < items.size(); i++ ) {
            if ( coin( rng ) == 0 ) {
                const int q = quantity( rng );
                transaction.push_back( occurrence( items[i], q, double( q * prices[i] ) ) );
            }
        }
        if ( !transaction.empty() ) {
            store.push_back( transaction );
        }
    }
    return store;
}

// Exhaustive subset enumeration over the positive-utility occurrences.
inline std::set<HighUtilityItemset> brute_force(const std::vector<Transaction>& store, double min_utility,
                                                std::size_t max_length = 0)
{
    std::vector<std::map<Item, double>> rows;
    std::set<Item> distinct;
    for ( const Transaction& transaction : store ) {
        std::map<Item, double> row;
        for ( const TransactionItem& entry : transaction ) {
            row[entry.item] += entry.utility;
        }
        for ( auto it = row.begin(); it != row.end(); ) {
            if ( it->second <= 0 ) { row.erase( it++ ); }
            else { distinct.insert( it->first ); ++it; }
        }
        rows.push_back( row );
    }

    const std::vector<Item> items( distinct.begin(), distinct.end() );
    std::set<HighUtilityItemset> result;
    for ( unsigned long mask = 1; mask < ( 1ul << items.size() ); mask++ ) {
        std::set<Item> candidate;
        for ( std::size_t i = 0; i < items.size(); i++ ) {
            if ( mask & ( 1ul << i ) ) { candidate.insert( items[i] ); }
        }
        if ( max_length && candidate.size() > max_length ) { continue; }

        double utility = 0;
        int support = 0;
        for ( const auto& row : rows ) {
            double row_utility = 0;
            bool contained = true;
            for ( const Item& item : candidate ) {
                const auto it = row.find( item );
                if ( it == row.end() ) { contained = false; break; }
                row_utility += it->second;
            }
            if ( contained ) {
                utility += row_utility;
                ++support;
            }
        }
        if ( support > 0 && utility >= min_utility ) {
            result.insert( itemset( candidate, utility, support ) );
        }
    }
    return result;
}

}  // namespace test_util

#endif  // TEST_UTIL_HPP
