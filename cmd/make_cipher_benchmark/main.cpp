#include "common/common.hpp"

#include "cipherlist/benchmark.hpp"
#include "cipherlist/cipher_list.hpp"

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace cipherlist;
namespace po = boost::program_options;

static string all_path;
static string blacklist_path;
static string output;
static vector<string> groups;
static string max_id;
static bool no_group_check = false;
static benchmark_options options;

static void parse_options(int argc, char** argv);

static void print_warnings(const string& path, const vector<parse_warning>& warnings) {
    for (const parse_warning& w : warnings) {
        fmt::print(cerr, "Unable to parse {} line {}:\n{}\n", path, w.line, w.text);
    }
}

int main(int argc, char** argv) {
    return cli_main([&]{
        parse_options(argc, argv);

        blacklist_data data = load_blacklist(all_path, blacklist_path);
        print_warnings(all_path, data.all_warnings);
        print_warnings(blacklist_path, data.blacklist_warnings);

        fmt::print(cerr, "Read {} cipher ids from {} and {} banned ciphers from {}.\n",
                   data.all.size(), all_path, data.banned.size(), blacklist_path);

        benchmark_source source = generate_benchmark(data.banned, options);

        if (output.empty()) {
            cout << source.text;
            cout.flush();
        } else {
            ofstream out(output);
            if (!out) {
                fmt::print(cerr, "Failed to open output file {}.\n", output);
                return 1;
            }
            out << source.text;
            if (!out.flush()) {
                fmt::print(cerr, "Failed to write output file {}.\n", output);
                return 1;
            }
        }

        fmt::print(cerr, "Generated {} ({} intervals, {} terms, {} lookup tables of {} bytes).\n",
                   output.empty() ? "benchmark on stdout" : output,
                   source.intervals, source.terms, source.tables, source.table_bytes);
        return 0;
    });
}

/// Parses a decimal or (0x prefixed) hexadecimal number.
static u64 parse_number(const string& option, const string& str) {
    size_t pos = 0;
    u64 value = 0;
    try {
        value = stoull(str, &pos, 0);
    } catch (const logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != str.size()) {
        throw po::invalid_option_value(option + " " + str);
    }
    return value;
}

static void parse_options(int argc, char** argv) {
    po::options_description desc("Options");
    desc.add_options()
            ("help,h", "Show this message.")
            ("all", po::value(&all_path)->value_name("PATH")->default_value("all_cipher_ids.txt"),
             "File with the ids of all cipher suites.")
            ("blacklist", po::value(&blacklist_path)->value_name("PATH")->default_value("http2_blacklisted_ciphers.txt"),
             "File with the names of the blacklisted cipher suites.")
            ("output,o", po::value(&output)->value_name("PATH"),
             "Output file for the generated C program. Defaults to stdout.")
            ("id-count", po::value(&options.id_count)->value_name("N")->default_value(options.id_count),
             "Number of random ids tested by every method.")
            ("id-mask", po::value(&options.id_mask)->value_name("M")->default_value(options.id_mask),
             "Random ids are masked with this value.")
            ("range-threshold", po::value(&options.range_threshold)->value_name("K")->default_value(options.range_threshold),
             "Runs of at most K ids are tested with == instead of a range comparison.")
            ("group", po::value(&groups)->value_name("HH")->composing(),
             "Allowed high byte of cipher ids (may be repeated). Defaults to 0x00 and 0xC0.")
            ("no-group-check", po::bool_switch(&no_group_check),
             "Accept cipher ids in any group.")
            ("max-id", po::value(&max_id)->value_name("ID")->default_value("0xFFFF"),
             "Largest supported cipher id.");

    po::variables_map vm;
    try {
        po::command_line_parser p(argc, argv);
        p.options(desc);
        po::store(p.run(), vm);

        if (vm.count("help")) {
            ostringstream help;
            help << desc;
            fmt::print(cerr, "Usage: {0} OPTION...\n"
                             "\n"
                             "Reads the list of cipher suite ids and the HTTP/2 cipher suite blacklist\n"
                             "and generates a C program that benchmarks several methods to test\n"
                             "whether a cipher id is blacklisted.\n"
                             "\n"
                             "{1}",
                       argv[0], help.str());
            throw exit_main(0);
        }

        po::notify(vm);

        if (options.id_count == 0) {
            throw po::invalid_option_value("--id-count 0");
        }

        options.max_id = parse_number("--max-id", max_id);
        if (no_group_check) {
            options.allowed_groups.clear();
        } else if (!groups.empty()) {
            options.allowed_groups.clear();
            for (const string& g : groups) {
                options.allowed_groups.push_back(parse_number("--group", g));
            }
        }
    } catch (const po::error& e) {
        fmt::print(cerr, "Failed to parse arguments: {}.\n", e.what());
        throw exit_main(1);
    }
}
