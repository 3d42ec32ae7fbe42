#include <chrono>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <omp.h>

#include <boost/program_options.hpp>

#include "database.hpp"
#include "huiminer.hpp"
#include "uptree.hpp"

using namespace std;
namespace po = boost::program_options;

namespace {

void write_itemsets(ostream& out, const MiningResult& result)
{
    for ( const HighUtilityItemset& itemset : result.itemsets ) {
        for ( const Item& item : itemset.items ) {
            out << item << " ";
        }
        out << "#UTIL: " << itemset.utility << " #SUP: " << itemset.support << "\n";
    }
}

double seconds_since(const chrono::steady_clock::time_point& start)
{
    auto stop = chrono::steady_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>( stop - start );
    return (double)duration.count() / 1000.00;
}

int run(int argc, char* argv[])
{
    po::options_description generic( "Generic options" );
    generic.add_options()
        ( "help,h", "Produce help message" )
        ;

    string outputFilename;
    string utilitiesFilename;
    double minUtility = 0;
    double defaultUtility = 0;
    double twuPrune = 0;
    double timeLimit = 0;
    size_t maxItemsets = 0;
    size_t maxLength = 0;
    int maxThreads = 1;

    po::options_description config( "Parameters" );
    config.add_options()
        ( "min-utility,m", po::value<double>( &minUtility )->required(),
            "Minimum utility of a high-utility itemset" )
        ( "utilities,u", po::value<string>( &utilitiesFilename ),
            "Item utility file (item utility per line); derived from the transactions if absent" )
        ( "default-utility", po::value<double>( &defaultUtility ),
            "External utility assumed for items missing from the utility file" )
        ( "max-itemsets,k", po::value<size_t>( &maxItemsets )->default_value( 1000 ),
            "Stop after this many itemsets, or zero for no limit" )
        ( "max-length,l", po::value<size_t>( &maxLength )->default_value( 0 ),
            "Maximum itemset length or zero for no maximum" )
        ( "threads,t", po::value<int>( &maxThreads )->default_value( 1 ),
            "Number of mining threads" )
        ( "time-limit", po::value<double>( &timeLimit )->default_value( 0 ),
            "Stop mining after this many seconds, or zero for no limit" )
        ( "twu-prune", po::value<double>( &twuPrune )->default_value( 0 ),
            "Leave items with a lower transaction-weighted utility out of the tree" )
        ( "output,o", po::value<string>( &outputFilename ),
            "Itemset output file (standard output if absent)" )
        ;

    po::options_description hidden( "Hidden options" );
    hidden.add_options()
        ( "input", po::value<vector<string> >(), "Transaction input file" )
        ;

    po::options_description visible_options;
    visible_options.add( generic ).add( config );

    po::options_description all_options;
    all_options.add( config ).add( generic ).add( hidden );

    po::positional_options_description p;
    p.add( "input", -1 );

    po::variables_map vm;
    po::store( po::command_line_parser( argc, argv ).options( all_options ).positional( p ).run(), vm );

    if ( vm.count( "help" ) || vm.count( "input" ) == 0 ||
        vm["input"].as<vector<string> >().size() != 1 )
    {
        cerr << "Usage: uptree-hui [options] transactions.txt" << endl;
        cerr << endl;
        cerr << "Required parameters:" << endl;
        cerr << "  transactions.txt    Transactions, one per line: items:utilities:quantities" << endl;
        cerr << visible_options << endl;
        return vm.count( "help" ) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    po::notify( vm );

    const string input = vm["input"].as<vector<string> >()[0];

    MiningOptions options( minUtility );
    options.max_itemsets = maxItemsets;
    options.max_length = maxLength;
    options.max_threads = maxThreads;
    options.time_limit_seconds = timeLimit;
    options.validate();

    BuildOptions buildOptions;
    buildOptions.twu_threshold = twuPrune;
    buildOptions.validate();

    // read the transactions and the item utilities
    const TransactionDB db = load_transactions( input );

    ItemUtilityTable utilities;
    if ( vm.count( "default-utility" ) ) {
        utilities = ItemUtilityTable( defaultUtility );
    }
    if ( !utilitiesFilename.empty() ) {
        const size_t skipped = load_item_utilities( utilitiesFilename, utilities );
        if ( skipped ) {
            cerr << "Warning: skipped " << skipped << " malformed utility line(s)" << endl;
        }
    }
    else {
        cerr << "Warning: no item utility file, using the mean unit utility of each item" << endl;
        utilities = vm.count( "default-utility" )
            ? ItemUtilityTable::from_transactions( db.transactions, defaultUtility )
            : ItemUtilityTable::from_transactions( db.transactions );
    }

    cout << "**************************************************************************" << endl;
    cout << "START <dataset>, <minUtil>, #p" << endl;
    cout << "**************************************************************************" << endl;
    cout << "DS Name: " << input << endl;
    cout << "DS length: " << db.transactions.size() << endl;
    cout << "Skipped lines: " << db.skipped_lines << endl;
    cout << "minUtil: " << minUtility << endl;
    cout << "Threads: " << maxThreads << " (max. available " << omp_get_max_threads() << ")" << endl;

    auto start = chrono::steady_clock::now();
    const UPTree uptree( db.transactions, utilities, buildOptions );
    cout << "Tree nodes: " << uptree.node_count() << ", items: " << uptree.header_table().size()
         << ", skipped transactions: " << uptree.skipped_transactions() << endl;
    cout << "Build time taken(seconds): " << seconds_since( start ) << endl;

    start = chrono::steady_clock::now();
    const MiningResult result = mine( uptree, options );
    cout << "Mining time taken(seconds): " << seconds_since( start ) << endl;
    cout << "Candidates: " << result.statistics.candidates << ", pruned: " << result.statistics.pruned
         << ", projections: " << result.statistics.projections << endl;
    cout << "Number of high-utility itemsets: " << result.itemsets.size() << endl;
    if ( !result.complete ) {
        cout << "PARTIAL result, stopped by " << to_string( result.stop_reason ) << endl;
    }
    cout << "**************************************************************************" << endl;
    cout << "END" << endl;
    cout << "**************************************************************************" << endl;

    if ( outputFilename.empty() ) {
        write_itemsets( cout, result );
    }
    else {
        ofstream fout( outputFilename );
        if ( !fout.is_open() ) {
            throw ConfigError( "unable to open output file '" + outputFilename + "'" );
        }
        write_itemsets( fout, result );
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[])
{
    try {
        return run( argc, argv );
    }
    catch ( const exception& e ) {
        cerr << "Error: " << e.what() << endl;
    }
    return EXIT_FAILURE;
}
