#ifndef CIPHERLIST_CIPHER_LIST_HPP
#define CIPHERLIST_CIPHER_LIST_HPP

#include "cipherlist/common.hpp"

#include <istream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

/// \file
/// Parsers for the cipher suite id list and the cipher suite blacklist.

namespace cipherlist {

class parse_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/// A blacklisted cipher name has no entry in the id list.
class unknown_cipher : public parse_error {
public:
    using parse_error::parse_error;
};

using cipher_id = u32;

struct cipher {
    cipher_id id;
    std::string name;
};

inline bool operator==(const cipher& a, const cipher& b) {
    return a.id == b.id && a.name == b.name;
}

inline std::ostream& operator<<(std::ostream& o, const cipher& c) {
    return o << "id: " << c.id << " name: " << c.name;
}

/// Maps cipher names to their ids.
using cipher_map = std::map<std::string, cipher_id>;

/// A line that did not match the expected format and has been skipped.
struct parse_warning {
    size_t line;        // 1-based
    std::string text;
};

/// Parses a list of cipher ids. Every line has the form
///
///     0x<hex id> <name> [ignored...]
///
/// where the id has 1 to 6 hex digits and the leading `0` is optional.
/// Empty lines and lines starting with `#` are skipped.
/// Lines in any other format are reported in `warnings` and skipped.
///
/// If a name is defined more than once, the last definition wins.
void parse_cipher_ids(std::istream& in, cipher_map& out, std::vector<parse_warning>& warnings);

/// Parses a blacklist file containing one cipher name per line
/// (surrounded by optional blanks).
/// Empty lines and lines starting with `#` are skipped.
/// Lines in any other format are reported in `warnings` and skipped.
void parse_blacklist(std::istream& in, std::vector<std::string>& out, std::vector<parse_warning>& warnings);

/// Looks up the id of every blacklisted name.
/// The result contains every name once and is sorted by id, then by name.
///
/// \throws unknown_cipher if a name is not in `all`.
std::vector<cipher> resolve_blacklist(const cipher_map& all, const std::vector<std::string>& names);

/// The result of reading the two input files.
struct blacklist_data {
    cipher_map all;
    std::vector<cipher> banned;

    /// Skipped lines of the id file and the blacklist file.
    std::vector<parse_warning> all_warnings;
    std::vector<parse_warning> blacklist_warnings;
};

/// Reads the id file and the blacklist file and resolves the blacklist.
///
/// \throws parse_error if a file cannot be opened, or if a
///         blacklisted name is unknown.
blacklist_data load_blacklist(const std::string& all_path, const std::string& blacklist_path);

} // namespace cipherlist

#endif // CIPHERLIST_CIPHER_LIST_HPP
