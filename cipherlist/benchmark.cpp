#include "cipherlist/benchmark.hpp"

#include "cipherlist/algorithm.hpp"
#include "cipherlist/expression.hpp"
#include "cipherlist/interval_compressor.hpp"

#include <fmt/format.h>

#include <iterator>
#include <stdexcept>

namespace cipherlist {

namespace {

const char* const program_head = R"c(
/*
Test the performance of methods used to check for cipher suites on the TLS 1.2
cipher suite blacklist from HTTP/2 RFC 7540.

This file was generated by make_cipher_benchmark.
*/

#include <stdio.h>
#include <stdlib.h>
#include <time.h>

#undef FALSE
#define FALSE 0

#undef TRUE
#define TRUE 1

struct cipher {
  int id;
  const char *name;
};

/* HTTP/2 - RFC OPTIONAL banned ciphers sorted by id */
struct cipher banned_ciphers[] = )c";

const char* const method0 = R"c(

/* Simple loop to check if id is banned */
int IsCipherBannedMethod0(int id)
{
  unsigned i;

  for(i = 0; i < sizeof banned_ciphers / sizeof banned_ciphers[0]; ++i) {
    if(id < banned_ciphers[i].id)
      return FALSE;
    else if(id == banned_ciphers[i].id)
      return TRUE;
  }

  return FALSE;
}

/* Conditional logic to check if id is banned */
#define IS_CIPHER_BANNED_METHOD1(id) )c";

const char* const method2 = R"c(

/* Conditional logic w/ lookup tables to check if id is banned */
#define IS_CIPHER_BANNED_METHOD2(id) )c";

const char* const method3 = R"c(

int CompareCipherId(const void *id, const void *cipher)
{
  return *(int *)id < ((struct cipher *)cipher)->id ? -1 :
           *(int *)id > ((struct cipher *)cipher)->id ? 1 : 0;
}

/* Binary search to check if id is banned */
int IsCipherBannedMethod3(int id)
{
  return !!bsearch(&id, banned_ciphers,
                   sizeof banned_ciphers / sizeof banned_ciphers[0],
                   sizeof banned_ciphers[0], CompareCipherId);
}

/* Switch statement to check if id is banned */
int IsCipherBannedMethod4(int id)
{
  switch(id) {
)c";

// Followed by the definitions of ID_COUNT and ID_MASK.
const char* const method4_tail = R"c(
    return TRUE;
  }
  return FALSE;
}

void *malloc_or_die(size_t bytes)
{
  void *p;

  p = malloc(bytes);
  if(!p) {
    fprintf(stderr, "Fatal: Out of memory.\n");
    exit(EXIT_FAILURE);
  }

  return p;
}

)c";

const char* const program_main = R"c(
#define METHOD_COUNT  5

#if METHOD_COUNT > 9
#error "Fix method name parsing for more than a single digit, see method_num"
#endif

int main(int argc, char *argv[])
{
  long i;
  int *random_ids;
  int **results;

  (void)argc;
  (void)argv;

  random_ids = malloc_or_die(ID_COUNT * sizeof *random_ids);
  results = malloc_or_die(METHOD_COUNT * sizeof *results);
  for(i = 0; i < METHOD_COUNT; ++i) {
    results[i] = malloc_or_die(ID_COUNT * sizeof **results);
  }

  printf("Generating %ld random ids.\n", (long)ID_COUNT);

  srand((unsigned)time(NULL));
  for(i = 0; i < ID_COUNT; ++i) {
    random_ids[i] = rand() & ID_MASK;
  }

/* Call with method 0 first since we compare against that result table. */
#define TEST_METHOD(method, description) { \
  int method_num; \
  clock_t start, end; \
  \
  method_num = #method[sizeof #method - 2] - 48; \
  if(method_num < 0 || method_num >= METHOD_COUNT) { \
    fprintf(stderr, "Fatal: Unrecognized method: %s\n", #method); \
    exit(EXIT_FAILURE); \
  } \
  \
  printf("\nTesting method %d: %s: %s.\n", \
         method_num, #method, description); \
  \
  start = clock(); \
  for(i = 0; i < ID_COUNT; ++i) { \
    results[method_num][i] = method(random_ids[i]); \
  } \
  end = clock(); \
  \
  printf("%s took %f seconds.\n", \
         #method, ((double) (end - start)) / CLOCKS_PER_SEC); \
  \
  if(method_num) { \
    for(i = 0; i < ID_COUNT; ++i) { \
      if(results[0][i] != results[method_num][i]) { \
        fprintf(stderr, "Fatal: Test of method %d failed: id 0x%x is %s.\n", \
                method_num, random_ids[i], \
                results[method_num][i] ? "TRUE" : "FALSE"); \
        exit(EXIT_FAILURE); \
      } \
    } \
  } \
}

  TEST_METHOD(IsCipherBannedMethod0, "simple loop");
  TEST_METHOD(IS_CIPHER_BANNED_METHOD1, "conditional logic");
  TEST_METHOD(IS_CIPHER_BANNED_METHOD2, "conditional logic w/ lookup tables");
  TEST_METHOD(IsCipherBannedMethod3, "binary search");
  TEST_METHOD(IsCipherBannedMethod4, "switch statement");

  return EXIT_SUCCESS;
}
)c";

/// Renders the C array initializer of the banned ciphers.
std::string render_cipher_array(const std::vector<cipher>& banned) {
    fmt::memory_buffer out;
    bool first = true;
    for (const cipher& c : banned) {
        fmt::format_to(std::back_inserter(out), "{}\n  {{ {}, \"{}\" }}",
                       first ? "{" : ",", hex(c.id), c.name);
        first = false;
    }
    fmt::format_to(std::back_inserter(out), "\n}};");
    return fmt::to_string(out);
}

} // namespace

partition make_partition(const benchmark_options& options) {
    partition p = byte_partition(options.shift);
    p.max_value = options.max_id;
    p.allowed_groups = options.allowed_groups;
    return p;
}

benchmark_source generate_benchmark(const std::vector<cipher>& banned, const benchmark_options& options) {
    if (banned.empty()) {
        throw std::invalid_argument("The blacklist does not contain any ciphers");
    }
    Expects(options.id_count > 0);

    std::vector<u64> ids;
    ids.reserve(banned.size());
    for (const cipher& c : banned) {
        ids.push_back(c.id);
    }
    ids = sorted_unique(ids);

    const auto intervals = compress(ids);
    const auto terms = to_terms(intervals, options.range_threshold);
    const auto index = bitset_index::build(ids, make_partition(options));

    benchmark_source source;
    source.ciphers = banned.size();
    source.intervals = intervals.size();
    source.terms = terms.size();
    source.tables = index.group_count();
    source.table_bytes = index.byte_size();

    std::string& text = source.text;
    text += program_head;
    text += render_cipher_array(banned);
    text += method0;
    text += render_condition(terms);
    text += method2;
    text += render_lookup_condition(index, options.shift);
    text += method3;
    text += render_switch_cases(ids);
    text += method4_tail;
    text += fmt::format("#define ID_COUNT      {}L\n", options.id_count);
    text += fmt::format("#define ID_MASK       {}\n", options.id_mask);
    text += program_main;
    return source;
}

} // namespace cipherlist
