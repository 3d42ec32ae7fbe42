#ifndef UPTREE_HPP
#define UPTREE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

using Item = std::string;

struct TransactionItem {
    Item item;
    int quantity;
    double utility;     // transaction-local utility of this occurrence
};

using Transaction = std::vector<TransactionItem>;

// malformed transaction data; recovered by skipping the transaction
class DataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// invalid configuration; raised before any mining starts
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Global external (unit) utility of every item. Without a fallback policy a
// lookup of an unknown item is a configuration error.
class ItemUtilityTable {
public:
    ItemUtilityTable();
    explicit ItemUtilityTable(double default_utility);

    void set(const Item&, double);
    bool contains(const Item&) const;
    double at(const Item&) const;

    // returns the entry, synthesizing it from the fallback when missing
    double resolve(const Item&);
    // like resolve, but never fails: without a fallback the built-in default is used
    double resolve_or_default(const Item&);

    bool has_default() const { return has_default_; }
    double default_utility() const { return default_utility_; }
    std::size_t size() const { return utilities.size(); }
    bool empty() const { return utilities.empty(); }
    std::size_t synthesized() const { return synthesized_; }

    // mean observed unit utility (sum of utilities / sum of quantities) per item
    static ItemUtilityTable from_transactions(const std::vector<Transaction>&);
    // same, keeping default_utility as the fallback for items seen later
    static ItemUtilityTable from_transactions(const std::vector<Transaction>&, double default_utility);

    static constexpr double kBuiltinDefaultUtility = 1.0;

private:
    std::map<Item, double> utilities;
    bool has_default_;
    double default_utility_;
    std::size_t synthesized_;
};

struct UPNode {
    const Item item;
    int count;
    double utility;
    // utility of each ancestor item (root side first) over the transactions through this node
    std::vector<double> path_utility;
    std::weak_ptr<UPNode> node_link;
    std::weak_ptr<UPNode> parent;
    std::map<Item, std::shared_ptr<UPNode>> children;

    UPNode(const Item&, const std::shared_ptr<UPNode>&);

    std::shared_ptr<UPNode> child(const Item&) const;
    bool is_root() const { return parent.expired(); }
};

struct HeaderEntry {
    std::weak_ptr<UPNode> first_node;
    std::weak_ptr<UPNode> last_node;
    double total_utility;
    double potential_utility;
    int support;
    std::size_t rank;

    HeaderEntry() : total_utility( 0 ), potential_utility( 0 ), support( 0 ), rank( 0 ) {}
};

struct BuildOptions {
    // items whose transaction-weighted utility stays below this are left out of the tree
    double twu_threshold;

    BuildOptions() : twu_threshold( 0 ) {}
    void validate() const;
};

class UPTree {
public:
    UPTree();
    UPTree(const std::vector<Transaction>&, ItemUtilityTable&, const BuildOptions& = BuildOptions());

    // the header table points into the nodes, so a tree has a single owner
    UPTree(const UPTree&) = delete;
    UPTree& operator=(const UPTree&) = delete;

    // incremental update; returns false when the transaction was skipped as malformed
    bool insert(const Transaction&, ItemUtilityTable&);

    bool empty() const;
    const std::shared_ptr<UPNode>& root() const { return root_; }
    const std::map<Item, HeaderEntry>& header_table() const { return header_table_; }
    // items by rank, root side first
    const std::vector<Item>& item_order() const { return item_order_; }

    std::size_t transaction_count() const { return transaction_count_; }
    std::size_t skipped_transactions() const { return skipped_transactions_; }
    std::size_t node_count() const { return node_count_; }

    double twu_threshold() const { return twu_threshold_; }
    const std::map<Item, double>& excluded_twu() const { return excluded_twu_; }
    // true when no item left out by TWU pruning could reach min_utility
    bool complete_for(double min_utility) const;

    // sum of the node utilities along the node-link chain of an item
    double chain_utility(const Item&) const;

private:
    struct Occurrence {
        Item item;
        int quantity;
        double utility;
    };

    std::vector<Occurrence> prepare(const Transaction&) const;
    void rank_new_items(const std::vector<Occurrence>&, ItemUtilityTable&);
    void insert_path(std::vector<Occurrence>&);
    void link_node(const std::shared_ptr<UPNode>&);

    std::shared_ptr<UPNode> root_;
    std::map<Item, HeaderEntry> header_table_;
    std::map<Item, std::size_t> rank_by_item;
    std::vector<Item> item_order_;

    double twu_threshold_;
    std::map<Item, double> twu_by_item;
    std::map<Item, double> excluded_twu_;

    std::size_t transaction_count_;
    std::size_t skipped_transactions_;
    std::size_t node_count_;
};

#endif  // UPTREE_HPP
