#ifndef DATABASE_HPP
#define DATABASE_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "uptree.hpp"

struct TransactionDB {
    std::vector<Transaction> transactions;
    std::size_t skipped_lines;

    TransactionDB() : transactions(), skipped_lines( 0 ) {}
};

// item1 item2 ... itemN:utility1 ... utilityN:quantity1 ... quantityN
Transaction parse_transaction_line(const std::string&);

// malformed lines are skipped with a warning and counted
TransactionDB load_transactions(std::istream&);
TransactionDB load_transactions(const std::string& path);

// one "item utility" pair per line; returns the number of skipped lines
std::size_t load_item_utilities(std::istream&, ItemUtilityTable&);
std::size_t load_item_utilities(const std::string& path, ItemUtilityTable&);

#endif  // DATABASE_HPP
