#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "database.hpp"

using namespace std;

namespace {

vector<string> split_fields(const string& part)
{
    vector<string> fields;
    stringstream ss( part );
    string field;
    while ( ss >> field ) {
        fields.push_back( field );
    }
    return fields;
}

double parse_utility(const string& field)
{
    size_t consumed = 0;
    double value = 0;
    try {
        value = stod( field, &consumed );
    }
    catch ( const logic_error& ) {
        throw DataError( "invalid utility '" + field + "'" );
    }
    if ( consumed != field.size() || !std::isfinite( value ) || value < 0 ) {
        throw DataError( "invalid utility '" + field + "'" );
    }
    return value;
}

int parse_quantity(const string& field)
{
    size_t consumed = 0;
    int value = 0;
    try {
        value = stoi( field, &consumed );
    }
    catch ( const logic_error& ) {
        throw DataError( "invalid quantity '" + field + "'" );
    }
    if ( consumed != field.size() || value < 1 ) {
        throw DataError( "invalid quantity '" + field + "'" );
    }
    return value;
}

string strip(const string& line)
{
    const string blanks = " \t\r\n\"";
    const size_t begin = line.find_first_not_of( blanks );
    if ( begin == string::npos ) { return string(); }
    const size_t end = line.find_last_not_of( blanks );
    return line.substr( begin, end - begin + 1 );
}

}  // namespace

Transaction parse_transaction_line(const string& line)
{
    const string cleaned = strip( line );

    vector<string> parts;
    stringstream ss( cleaned );
    string part;
    while ( getline( ss, part, ':' ) ) {
        parts.push_back( part );
    }
    if ( parts.size() != 3 ) {
        throw DataError( "expected items:utilities:quantities, got " + to_string( parts.size() ) + " part(s)" );
    }

    const vector<string> items = split_fields( parts[0] );
    const vector<string> utilities = split_fields( parts[1] );
    const vector<string> quantities = split_fields( parts[2] );
    if ( items.empty() ) {
        throw DataError( "no items" );
    }
    if ( items.size() != utilities.size() || items.size() != quantities.size() ) {
        throw DataError( "mismatch between items (" + to_string( items.size() ) + "), utilities ("
            + to_string( utilities.size() ) + ") and quantities (" + to_string( quantities.size() ) + ")" );
    }

    Transaction transaction;
    for ( size_t i = 0; i < items.size(); i++ ) {
        transaction.push_back( TransactionItem{ items[i], parse_quantity( quantities[i] ), parse_utility( utilities[i] ) } );
    }
    return transaction;
}

TransactionDB load_transactions(istream& in)
{
    TransactionDB db;
    string line;
    size_t line_number = 0;
    while ( getline( in, line ) ) {
        ++line_number;
        if ( strip( line ).empty() ) { continue; }
        try {
            db.transactions.push_back( parse_transaction_line( line ) );
        }
        catch ( const DataError& e ) {
            cerr << "Warning: skipping line " << line_number << ": " << e.what() << endl;
            ++db.skipped_lines;
        }
    }
    return db;
}

TransactionDB load_transactions(const string& path)
{
    ifstream fin( path );
    if ( !fin.is_open() ) {
        throw ConfigError( "unable to open transaction file '" + path + "'" );
    }
    return load_transactions( fin );
}

size_t load_item_utilities(istream& in, ItemUtilityTable& table)
{
    size_t skipped = 0;
    string line;
    size_t line_number = 0;
    while ( getline( in, line ) ) {
        ++line_number;
        const vector<string> fields = split_fields( line );
        if ( fields.empty() ) { continue; }
        try {
            if ( fields.size() != 2 ) {
                throw DataError( "expected 'item utility'" );
            }
            table.set( fields[0], parse_utility( fields[1] ) );
        }
        catch ( const DataError& e ) {
            cerr << "Warning: skipping utility line " << line_number << ": " << e.what() << endl;
            ++skipped;
        }
    }
    return skipped;
}

size_t load_item_utilities(const string& path, ItemUtilityTable& table)
{
    ifstream fin( path );
    if ( !fin.is_open() ) {
        throw ConfigError( "unable to open item utility file '" + path + "'" );
    }
    return load_item_utilities( fin, table );
}
