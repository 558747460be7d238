#include <catch2/catch.hpp>

#include "cipherlist/benchmark.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace cipherlist;

namespace {

std::vector<cipher> sample_blacklist() {
    return {
        {0x00, "TLS_NULL_WITH_NULL_NULL"},
        {0x01, "TLS_RSA_WITH_NULL_MD5"},
        {0x02, "TLS_RSA_WITH_NULL_SHA"},
        {0x0A, "TLS_RSA_WITH_3DES_EDE_CBC_SHA"},
        {0xC02F, "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256"},
        {0xC030, "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384"},
    };
}

bool contains_text(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("generate benchmark program", "[benchmark]") {
    benchmark_source source = generate_benchmark(sample_blacklist());
    const std::string& text = source.text;

    CHECK(source.ciphers == 6);
    CHECK(source.intervals == 3);
    CHECK(source.terms == 4);
    CHECK(source.tables == 2);
    CHECK(source.table_bytes == 64);

    CHECK(contains_text(text,
        "struct cipher banned_ciphers[] = {\n"
        "  { 0x00, \"TLS_NULL_WITH_NULL_NULL\" },\n"
        "  { 0x01, \"TLS_RSA_WITH_NULL_MD5\" },\n"
        "  { 0x02, \"TLS_RSA_WITH_NULL_SHA\" },\n"
        "  { 0x0A, \"TLS_RSA_WITH_3DES_EDE_CBC_SHA\" },\n"
        "  { 0xC02F, \"TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256\" },\n"
        "  { 0xC030, \"TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384\" }\n"
        "};\n"));

    CHECK(contains_text(text,
        "#define IS_CIPHER_BANNED_METHOD1(id) ( \\\n"
        "  (0x00 <= id && id <= 0x02) || id == 0x0A || \\\n"
        "  id == 0xC02F || id == 0xC030 \\\n"
        ")\n"));

    CHECK(contains_text(text,
        "#define IS_CIPHER_BANNED_METHOD2(id) ( \\\n"
        "  (0x0000 <= id && id <= 0x00FF && \\\n"
        "    \"\\x07\\x04\\x00"));
    CHECK(contains_text(text, "  (0xC000 <= id && id <= 0xC0FF && \\\n"));

    CHECK(contains_text(text,
        "  switch(id) {\n"
        "  case 0x00: case 0x01: case 0x02: case 0x0A: case 0xC02F:\n"
        "  case 0xC030:\n"
        "    return TRUE;\n"));

    CHECK(contains_text(text, "int IsCipherBannedMethod0(int id)"));
    CHECK(contains_text(text, "int IsCipherBannedMethod3(int id)"));
    CHECK(contains_text(text, "int IsCipherBannedMethod4(int id)"));
    CHECK(contains_text(text, "#define ID_COUNT      10000000L\n"));
    CHECK(contains_text(text, "#define ID_MASK       32767\n"));
    CHECK(contains_text(text, "TEST_METHOD(IsCipherBannedMethod4, \"switch statement\");"));
}

TEST_CASE("benchmark options", "[benchmark]") {
    benchmark_options options;
    options.id_count = 1000;
    options.id_mask = 0xFFFF;
    options.range_threshold = 0;

    benchmark_source source = generate_benchmark(sample_blacklist(), options);
    CHECK(source.terms == 3);
    CHECK(contains_text(source.text, "#define ID_COUNT      1000L\n"));
    CHECK(contains_text(source.text, "#define ID_MASK       65535\n"));
    CHECK(contains_text(source.text, "(0x0A <= id && id <= 0x0A)"));
}

TEST_CASE("duplicate ids", "[benchmark]") {
    std::vector<cipher> banned{
        {0x0A, "TLS_ALIAS_A"},
        {0x0A, "TLS_ALIAS_B"},
    };
    benchmark_source source = generate_benchmark(banned);
    CHECK(source.ciphers == 2);
    CHECK(source.intervals == 1);
    CHECK(contains_text(source.text, "  case 0x0A:\n"));
    CHECK_FALSE(contains_text(source.text, "case 0x0A: case 0x0A:"));
}

TEST_CASE("invalid blacklists", "[benchmark]") {
    SECTION("empty") {
        REQUIRE_THROWS_AS(generate_benchmark(std::vector<cipher>()), std::invalid_argument);
    }

    SECTION("id too large") {
        std::vector<cipher> banned{{0x1C001, "TLS_TOO_LARGE"}};
        REQUIRE_THROWS_AS(generate_benchmark(banned), invalid_domain);
    }

    SECTION("unrecognized id") {
        std::vector<cipher> banned{{0x0101, "TLS_UNKNOWN_RANGE"}};
        REQUIRE_THROWS_AS(generate_benchmark(banned), unexpected_group);

        benchmark_options options;
        options.allowed_groups.clear();
        benchmark_source source = generate_benchmark(banned, options);
        CHECK(source.tables == 1);
        CHECK(contains_text(source.text, "(0x0100 <= id && id <= 0x01FF && \\\n"));
    }
}
