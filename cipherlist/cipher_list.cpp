#include "cipherlist/cipher_list.hpp"

#include <boost/fusion/include/adapt_struct.hpp>
#include <boost/spirit/home/x3.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

BOOST_FUSION_ADAPT_STRUCT(
    cipherlist::cipher, id, name
)

namespace cipherlist {

namespace parser {
    namespace x3 = boost::spirit::x3;

    using x3::rule;

    using x3::blank;
    using x3::char_;
    using x3::eoi;
    using x3::lit;
    using x3::omit;
    using x3::space;

    // Hex id with 1 to 6 digits.
    const x3::uint_parser<cipher_id, 16, 1, 6> hex_id{};

    // Anything but whitespace.
    const auto name = +(char_ - space);

    rule<class id_line_tag, cipher> id_line = "cipher id line";

    rule<class blacklist_line_tag, std::string> blacklist_line = "blacklist line";

    // 0x<id> <name> and whatever follows the name (usually the source document).
    const auto id_line_def =
            omit[-lit('0')] >> lit('x') >> hex_id
            >> omit[+blank] >> name
            >> omit[*char_];

    // A single name, optionally surrounded by blanks.
    const auto blacklist_line_def = omit[*blank] >> name >> omit[*blank] >> eoi;

    BOOST_SPIRIT_DEFINE(id_line, blacklist_line)
}

namespace {

/// Invokes `f(number, line)` for every line in `in`.
/// Line numbers start at 1, trailing carriage returns are removed.
template<typename Func>
void for_each_line(std::istream& in, Func&& f) {
    std::string line;
    size_t number = 0;
    while (std::getline(in, line)) {
        ++number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        f(number, line);
    }
}

bool is_comment_or_empty(const std::string& line) {
    return line.empty() || line.front() == '#';
}

/// Parses the complete line. Returns false if the parser failed
/// or did not consume all input.
template<typename Parser, typename Attribute>
bool parse_line(const std::string& line, const Parser& p, Attribute& attr) {
    auto first = line.begin();
    auto last = line.end();
    return parser::x3::parse(first, last, p, attr) && first == last;
}

void open_file(std::ifstream& in, const std::string& path) {
    in.open(path);
    if (!in) {
        throw parse_error(fmt::format("Can't open {} ({})", path, std::strerror(errno)));
    }
}

} // namespace

void parse_cipher_ids(std::istream& in, cipher_map& out, std::vector<parse_warning>& warnings) {
    for_each_line(in, [&](size_t number, const std::string& line) {
        if (is_comment_or_empty(line)) {
            return;
        }

        cipher c;
        if (!parse_line(line, parser::id_line, c)) {
            warnings.push_back(parse_warning{number, line});
            return;
        }
        out[c.name] = c.id;
    });
}

void parse_blacklist(std::istream& in, std::vector<std::string>& out, std::vector<parse_warning>& warnings) {
    for_each_line(in, [&](size_t number, const std::string& line) {
        if (is_comment_or_empty(line)) {
            return;
        }

        std::string name;
        if (!parse_line(line, parser::blacklist_line, name)) {
            warnings.push_back(parse_warning{number, line});
            return;
        }
        out.push_back(std::move(name));
    });
}

std::vector<cipher> resolve_blacklist(const cipher_map& all, const std::vector<std::string>& names) {
    std::map<std::string, cipher_id> banned;
    for (const std::string& name : names) {
        auto pos = all.find(name);
        if (pos == all.end()) {
            throw unknown_cipher("Can't find id for blacklisted cipher " + name);
        }
        banned[name] = pos->second;
    }

    std::vector<cipher> result;
    result.reserve(banned.size());
    for (const auto& entry : banned) {
        result.push_back(cipher{entry.second, entry.first});
    }

    // Equal ids are sorted by name.
    std::sort(result.begin(), result.end(), [](const cipher& a, const cipher& b) {
        return a.id < b.id || (a.id == b.id && a.name < b.name);
    });
    return result;
}

blacklist_data load_blacklist(const std::string& all_path, const std::string& blacklist_path) {
    blacklist_data data;

    {
        std::ifstream in;
        open_file(in, all_path);
        parse_cipher_ids(in, data.all, data.all_warnings);
    }

    std::vector<std::string> names;
    {
        std::ifstream in;
        open_file(in, blacklist_path);
        parse_blacklist(in, names, data.blacklist_warnings);
    }

    data.banned = resolve_blacklist(data.all, names);
    return data;
}

} // namespace cipherlist
