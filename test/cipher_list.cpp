#include <catch2/catch.hpp>

#include "cipherlist/cipher_list.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace cipherlist;

TEST_CASE("parse cipher ids", "[cipher-list]") {
    std::string input =
        "# Cipher suite ids\n"
        "\n"
        "0x00 TLS_NULL_WITH_NULL_NULL [RFC5246]\n"
        "0x0A\tTLS_RSA_WITH_3DES_EDE_CBC_SHA\r\n"
        "x2F TLS_RSA_WITH_AES_128_CBC_SHA\n"
        "0xC02F TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256 [RFC5289]\n"
        "0xc0a0 TLS_RSA_WITH_AES_128_CCM_8\n"
        "TLS_NOT_AN_ID_LINE\n"
        "0x1234567 TLS_TOO_MANY_DIGITS\n"
        "0xZZ TLS_NO_HEX\n"
        "0x0B\n"
        " 0x0C TLS_LEADING_BLANK\n"
        "0x0A TLS_RSA_WITH_3DES_EDE_CBC_SHA_REDEFINED\n"
        "0x10 TLS_RSA_WITH_3DES_EDE_CBC_SHA\n";
    std::istringstream in(input);

    cipher_map ids;
    std::vector<parse_warning> warnings;
    parse_cipher_ids(in, ids, warnings);

    REQUIRE(ids.size() == 6);
    CHECK(ids.at("TLS_NULL_WITH_NULL_NULL") == 0x00);
    CHECK(ids.at("TLS_RSA_WITH_AES_128_CBC_SHA") == 0x2F);
    CHECK(ids.at("TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256") == 0xC02F);
    CHECK(ids.at("TLS_RSA_WITH_AES_128_CCM_8") == 0xC0A0);
    CHECK(ids.at("TLS_RSA_WITH_3DES_EDE_CBC_SHA_REDEFINED") == 0x0A);

    // The last definition of a name wins.
    CHECK(ids.at("TLS_RSA_WITH_3DES_EDE_CBC_SHA") == 0x10);

    REQUIRE(warnings.size() == 5);
    CHECK(warnings[0].line == 8);
    CHECK(warnings[0].text == "TLS_NOT_AN_ID_LINE");
    CHECK(warnings[1].line == 9);
    CHECK(warnings[2].line == 10);
    CHECK(warnings[3].line == 11);
    CHECK(warnings[4].line == 12);
}

TEST_CASE("parse blacklist", "[cipher-list]") {
    std::string input =
        "# HTTP/2 blacklist\n"
        "TLS_NULL_WITH_NULL_NULL\n"
        "  TLS_RSA_WITH_AES_128_CBC_SHA \t\r\n"
        "\n"
        "TWO NAMES\n"
        "TLS_RSA_WITH_AES_128_CCM_8";
    std::istringstream in(input);

    std::vector<std::string> names;
    std::vector<parse_warning> warnings;
    parse_blacklist(in, names, warnings);

    const std::vector<std::string> expected{
        "TLS_NULL_WITH_NULL_NULL",
        "TLS_RSA_WITH_AES_128_CBC_SHA",
        "TLS_RSA_WITH_AES_128_CCM_8",
    };
    REQUIRE(names == expected);

    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].line == 5);
    CHECK(warnings[0].text == "TWO NAMES");
}

TEST_CASE("resolve blacklist", "[cipher-list]") {
    cipher_map all{
        {"B", 0x10},
        {"A", 0x10},
        {"C", 0x02},
        {"D", 0xC02F},
    };

    SECTION("sorted by id and name") {
        auto banned = resolve_blacklist(all, {"D", "B", "A", "C", "B"});
        REQUIRE(banned.size() == 4);
        CHECK(banned[0] == (cipher{0x02, "C"}));
        CHECK(banned[1] == (cipher{0x10, "A"}));
        CHECK(banned[2] == (cipher{0x10, "B"}));
        CHECK(banned[3] == (cipher{0xC02F, "D"}));
    }

    SECTION("unknown names") {
        REQUIRE_THROWS_AS((resolve_blacklist(all, {"A", "X"})), unknown_cipher);
        REQUIRE_THROWS_WITH(resolve_blacklist(all, {"X"}),
                            "Can't find id for blacklisted cipher X");
    }
}

TEST_CASE("load missing files", "[cipher-list]") {
    REQUIRE_THROWS_AS(load_blacklist("does/not/exist/all.txt", "does/not/exist/blacklist.txt"),
                      parse_error);
}
