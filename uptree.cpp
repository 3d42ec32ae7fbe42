#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "uptree.hpp"

using namespace std;

constexpr double ItemUtilityTable::kBuiltinDefaultUtility;

ItemUtilityTable::ItemUtilityTable() :
    utilities(), has_default_( false ), default_utility_( 0 ), synthesized_( 0 )
{
}

ItemUtilityTable::ItemUtilityTable(double default_utility) :
    utilities(), has_default_( true ), default_utility_( default_utility ), synthesized_( 0 )
{
    if ( !std::isfinite( default_utility ) || default_utility < 0 ) {
        throw ConfigError( "default item utility must be a non-negative number" );
    }
}

void ItemUtilityTable::set(const Item& item, double utility)
{
    if ( item.empty() ) {
        throw ConfigError( "item utility table: empty item id" );
    }
    if ( !std::isfinite( utility ) || utility < 0 ) {
        throw ConfigError( "item utility table: utility of '" + item + "' must be a non-negative number" );
    }
    utilities[item] = utility;
}

bool ItemUtilityTable::contains(const Item& item) const
{
    return utilities.count( item ) != 0;
}

double ItemUtilityTable::at(const Item& item) const
{
    const auto it = utilities.find( item );
    if ( it == utilities.end() ) {
        throw ConfigError( "no external utility for item '" + item + "'" );
    }
    return it->second;
}

double ItemUtilityTable::resolve(const Item& item)
{
    const auto it = utilities.find( item );
    if ( it != utilities.end() ) { return it->second; }
    if ( !has_default_ ) {
        throw ConfigError( "no external utility for item '" + item + "' and no default utility configured" );
    }
    utilities[item] = default_utility_;
    ++synthesized_;
    return default_utility_;
}

double ItemUtilityTable::resolve_or_default(const Item& item)
{
    const auto it = utilities.find( item );
    if ( it != utilities.end() ) { return it->second; }
    const double utility = has_default_ ? default_utility_ : kBuiltinDefaultUtility;
    utilities[item] = utility;
    ++synthesized_;
    return utility;
}

namespace {

void fill_mean_unit_utilities(const vector<Transaction>& transactions, ItemUtilityTable& table)
{
    map<Item, pair<double, long long>> totals;
    for ( const Transaction& transaction : transactions ) {
        for ( const TransactionItem& entry : transaction ) {
            if ( entry.item.empty() || entry.quantity < 1 || !std::isfinite( entry.utility ) || entry.utility < 0 ) {
                continue;
            }
            auto& total = totals[entry.item];
            total.first += entry.utility;
            total.second += entry.quantity;
        }
    }

    for ( const auto& total : totals ) {
        table.set( total.first, total.second.first / double( total.second.second ) );
    }
}

}  // namespace

ItemUtilityTable ItemUtilityTable::from_transactions(const vector<Transaction>& transactions)
{
    ItemUtilityTable table;
    fill_mean_unit_utilities( transactions, table );
    return table;
}

ItemUtilityTable ItemUtilityTable::from_transactions(const vector<Transaction>& transactions, double default_utility)
{
    ItemUtilityTable table( default_utility );
    fill_mean_unit_utilities( transactions, table );
    return table;
}

UPNode::UPNode(const Item& item, const shared_ptr<UPNode>& parent) :
    item( item ), count( 0 ), utility( 0 ), path_utility(), node_link(), parent( parent ), children()
{
}

shared_ptr<UPNode> UPNode::child(const Item& child_item) const
{
    const auto it = children.find( child_item );
    if ( it == children.end() ) { return nullptr; }
    return it->second;
}

void BuildOptions::validate() const
{
    if ( !std::isfinite( twu_threshold ) || twu_threshold < 0 ) {
        throw ConfigError( "TWU pruning threshold must be a non-negative number" );
    }
}

UPTree::UPTree() :
    root_( make_shared<UPNode>( Item{}, nullptr ) ), header_table_(), rank_by_item(), item_order_(),
    twu_threshold_( 0 ), twu_by_item(), excluded_twu_(),
    transaction_count_( 0 ), skipped_transactions_( 0 ), node_count_( 0 )
{
}

UPTree::UPTree(const vector<Transaction>& transactions, ItemUtilityTable& utilities, const BuildOptions& options) :
    UPTree()
{
    options.validate();
    twu_threshold_ = options.twu_threshold;

    // scan the transactions: validate, compute TWU and the estimated total utility of each item
    vector<vector<Occurrence>> accepted;
    accepted.reserve( transactions.size() );
    map<Item, double> estimated_by_item;
    const size_t synthesized_before = utilities.synthesized();

    for ( size_t i = 0; i < transactions.size(); i++ ) {
        vector<Occurrence> occurrences;
        try {
            occurrences = prepare( transactions[i] );
        }
        catch ( const DataError& e ) {
            cerr << "Warning: skipping transaction " << i << ": " << e.what() << endl;
            ++skipped_transactions_;
            continue;
        }

        double transaction_utility = 0;
        for ( const Occurrence& occurrence : occurrences ) {
            transaction_utility += occurrence.utility;
        }
        for ( const Occurrence& occurrence : occurrences ) {
            twu_by_item[occurrence.item] += transaction_utility;
            estimated_by_item[occurrence.item] += occurrence.quantity * utilities.resolve( occurrence.item );
        }
        accepted.push_back( std::move( occurrences ) );
    }

    if ( utilities.synthesized() > synthesized_before ) {
        cerr << "Warning: synthesized " << utilities.synthesized() - synthesized_before
             << " item utilities from the default utility " << utilities.default_utility() << endl;
    }

    // keep only items whose TWU reaches the pruning threshold
    for ( auto it = estimated_by_item.cbegin(); it != estimated_by_item.cend(); ) {
        const double twu = twu_by_item[it->first];
        if ( twu < twu_threshold_ ) {
            excluded_twu_[it->first] = twu;
            estimated_by_item.erase( it++ );
        }
        else { ++it; }
    }

    // order items by decreasing estimated utility
    struct utility_comparator
    {
        bool operator()(const pair<Item, double> &lhs, const pair<Item, double> &rhs) const
        {
            return std::tie(lhs.second, lhs.first) > std::tie(rhs.second, rhs.first);
        }
    };
    set<pair<Item, double>, utility_comparator> items_ordered_by_utility( estimated_by_item.cbegin(), estimated_by_item.cend() );
    for ( const auto& entry : items_ordered_by_utility ) {
        rank_by_item[entry.first] = item_order_.size();
        item_order_.push_back( entry.first );
    }

    // scan the transactions again, inserting each one along its ranked path
    for ( vector<Occurrence>& occurrences : accepted ) {
        insert_path( occurrences );
        ++transaction_count_;
    }
}

bool UPTree::insert(const Transaction& transaction, ItemUtilityTable& utilities)
{
    vector<Occurrence> occurrences;
    try {
        occurrences = prepare( transaction );
    }
    catch ( const DataError& e ) {
        cerr << "Warning: skipping new transaction: " << e.what() << endl;
        ++skipped_transactions_;
        return false;
    }

    for ( const Occurrence& occurrence : occurrences ) {
        if ( !utilities.contains( occurrence.item ) ) {
            const double utility = utilities.resolve_or_default( occurrence.item );
            cerr << "Warning: item '" << occurrence.item << "' has no external utility, using " << utility << endl;
        }
    }

    double transaction_utility = 0;
    for ( const Occurrence& occurrence : occurrences ) {
        transaction_utility += occurrence.utility;
    }

    vector<Occurrence> unseen;
    for ( const Occurrence& occurrence : occurrences ) {
        const double twu = twu_by_item[occurrence.item] += transaction_utility;

        auto excluded = excluded_twu_.find( occurrence.item );
        if ( excluded != excluded_twu_.end() ) {
            const double previous = excluded->second;
            excluded->second = twu;
            if ( previous < twu_threshold_ && twu >= twu_threshold_ ) {
                cerr << "Warning: item '" << occurrence.item << "' (TWU " << twu << ") now reaches the pruning threshold "
                     << twu_threshold_ << "; rebuild the tree to mine it" << endl;
            }
        }
        else if ( !rank_by_item.count( occurrence.item ) ) {
            if ( twu < twu_threshold_ ) {
                excluded_twu_[occurrence.item] = twu;
            }
            else {
                unseen.push_back( occurrence );
            }
        }
    }
    rank_new_items( unseen, utilities );

    insert_path( occurrences );
    ++transaction_count_;
    return true;
}

bool UPTree::empty() const
{
    return root_->children.empty();
}

bool UPTree::complete_for(double min_utility) const
{
    for ( const auto& excluded : excluded_twu_ ) {
        if ( excluded.second >= min_utility ) { return false; }
    }
    return true;
}

double UPTree::chain_utility(const Item& item) const
{
    const auto entry = header_table_.find( item );
    if ( entry == header_table_.end() ) { return 0; }

    double utility = 0;
    auto upnode = entry->second.first_node.lock();
    while ( upnode ) {
        utility += upnode->utility;
        upnode = upnode->node_link.lock();
    }
    return utility;
}

vector<UPTree::Occurrence> UPTree::prepare(const Transaction& transaction) const
{
    if ( transaction.empty() ) {
        throw DataError( "empty transaction" );
    }

    vector<Occurrence> occurrences;
    map<Item, size_t> position_by_item;
    for ( const TransactionItem& entry : transaction ) {
        if ( entry.item.empty() ) {
            throw DataError( "empty item id" );
        }
        if ( entry.quantity < 1 ) {
            throw DataError( "quantity of item '" + entry.item + "' must be at least 1" );
        }
        if ( !std::isfinite( entry.utility ) || entry.utility < 0 ) {
            throw DataError( "utility of item '" + entry.item + "' must be a non-negative number" );
        }

        // the same item listed twice counts as one occurrence
        const auto it = position_by_item.find( entry.item );
        if ( it == position_by_item.end() ) {
            position_by_item[entry.item] = occurrences.size();
            occurrences.push_back( Occurrence{ entry.item, entry.quantity, entry.utility } );
        }
        else {
            occurrences[it->second].quantity += entry.quantity;
            occurrences[it->second].utility += entry.utility;
        }
    }
    return occurrences;
}

void UPTree::rank_new_items(const vector<Occurrence>& unseen, ItemUtilityTable& utilities)
{
    vector<pair<Item, double>> new_items;
    for ( const Occurrence& occurrence : unseen ) {
        new_items.push_back( make_pair( occurrence.item, occurrence.quantity * utilities.resolve_or_default( occurrence.item ) ) );
    }
    sort( new_items.begin(), new_items.end(), [](const pair<Item, double>& lhs, const pair<Item, double>& rhs) {
        return std::tie(lhs.second, lhs.first) > std::tie(rhs.second, rhs.first);
    } );

    // items first seen after the build go below every existing item
    for ( const auto& entry : new_items ) {
        rank_by_item[entry.first] = item_order_.size();
        item_order_.push_back( entry.first );
    }
}

void UPTree::insert_path(vector<Occurrence>& occurrences)
{
    // drop zero-utility occurrences and items left out of the tree, then sort by rank
    occurrences.erase( remove_if( occurrences.begin(), occurrences.end(), [this](const Occurrence& occurrence) {
        return occurrence.utility <= 0 || !rank_by_item.count( occurrence.item );
    } ), occurrences.end() );
    sort( occurrences.begin(), occurrences.end(), [this](const Occurrence& lhs, const Occurrence& rhs) {
        return rank_by_item.at( lhs.item ) < rank_by_item.at( rhs.item );
    } );

    auto curr_upnode = root_;
    double prefix_utility = 0;
    for ( size_t depth = 0; depth < occurrences.size(); depth++ ) {
        const Occurrence& occurrence = occurrences[depth];

        auto curr_upnode_child = curr_upnode->child( occurrence.item );
        if ( !curr_upnode_child ) {
            // the child doesn't exist, create a new node
            curr_upnode_child = make_shared<UPNode>( occurrence.item, curr_upnode );
            curr_upnode_child->path_utility.assign( depth, 0.0 );
            curr_upnode->children[occurrence.item] = curr_upnode_child;
            link_node( curr_upnode_child );
            ++node_count_;
        }

        ++curr_upnode_child->count;
        curr_upnode_child->utility += occurrence.utility;
        for ( size_t i = 0; i < depth; i++ ) {
            curr_upnode_child->path_utility[i] += occurrences[i].utility;
        }

        HeaderEntry& entry = header_table_[occurrence.item];
        entry.total_utility += occurrence.utility;
        entry.potential_utility += prefix_utility + occurrence.utility;
        ++entry.support;

        prefix_utility += occurrence.utility;
        curr_upnode = curr_upnode_child;
    }
}

void UPTree::link_node(const shared_ptr<UPNode>& upnode)
{
    HeaderEntry& entry = header_table_[upnode->item];
    const auto last_upnode = entry.last_node.lock();
    if ( last_upnode ) {
        last_upnode->node_link = upnode;
    }
    else {
        entry.first_node = upnode;
        entry.rank = rank_by_item.at( upnode->item );
    }
    entry.last_node = upnode;
}
