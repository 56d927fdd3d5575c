#include <vitrine/caching/cache_key.hpp>

#include <sstream>
#include <unordered_set>

#include <vitrine/utilities/errors.h>
#include <vitrine/utilities/testing.h>

using namespace vitrine;

TEST_CASE("valid cache keys", "[caching][cache_key]")
{
    auto key = make_cache_key("p1", "detail", "a.jpg");
    REQUIRE(key.entity_id == "p1");
    REQUIRE(key.folder == "detail");
    REQUIRE(key.filename == "a.jpg");

    // The folder may be empty.
    REQUIRE(is_valid_cache_key(make_cache_key("p1", "", "a.jpg")));

    auto sidecar = make_sidecar_key("p1");
    REQUIRE(sidecar == cache_key{"p1", "", "meta.json"});

    std::ostringstream stream;
    stream << key << " " << sidecar;
    REQUIRE(stream.str() == "p1/detail/a.jpg p1/meta.json");
}

TEST_CASE("invalid cache keys", "[caching][cache_key]")
{
    auto check_invalid
        = [](string entity_id, string folder, string filename) {
              CAPTURE(entity_id);
              CAPTURE(folder);
              CAPTURE(filename);
              REQUIRE(!is_valid_cache_key(
                  cache_key{entity_id, folder, filename}));
              try
              {
                  make_cache_key(entity_id, folder, filename);
                  FAIL("no exception thrown");
              }
              catch (invalid_cache_key& e)
              {
                  get_required_error_info<invalid_key_component_info>(e);
                  get_required_error_info<internal_error_message_info>(e);
              }
          };

    check_invalid("", "detail", "a.jpg");
    check_invalid("p1", "detail", "");
    check_invalid("..", "detail", "a.jpg");
    check_invalid("p1", ".", "a.jpg");
    check_invalid("p1", "detail", "..");
    check_invalid("p1/p2", "detail", "a.jpg");
    check_invalid("p1", "de\\tail", "a.jpg");
    check_invalid("p1", "detail", "x/a.jpg");
    check_invalid("p1", "detail", "a.jpg.part");
}

TEST_CASE("cache key ordering and hashing", "[caching][cache_key]")
{
    auto a = make_cache_key("p1", "detail", "a.jpg");
    auto b = make_cache_key("p1", "detail", "b.jpg");
    auto c = make_cache_key("p2", "", "a.jpg");
    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(!(a < a));
    REQUIRE(a != b);

    std::unordered_set<cache_key> keys{a, b, c, a};
    REQUIRE(keys.size() == 3);
    REQUIRE(hash_value(a) == hash_value(cache_key{"p1", "detail", "a.jpg"}));
}

TEST_CASE("entry state transitions", "[caching][cache_key]")
{
    using s = entry_state;

    // the normal lifecycle
    REQUIRE(is_legal_transition(s::MISSING, s::DOWNLOADING));
    REQUIRE(is_legal_transition(s::DOWNLOADING, s::CACHED));
    REQUIRE(is_legal_transition(s::DOWNLOADING, s::FAILED));
    // discovery of an existing file
    REQUIRE(is_legal_transition(s::MISSING, s::CACHED));
    // retry
    REQUIRE(is_legal_transition(s::FAILED, s::DOWNLOADING));
    // eviction
    REQUIRE(is_legal_transition(s::CACHED, s::MISSING));
    // an interrupted transfer
    REQUIRE(is_legal_transition(s::DOWNLOADING, s::MISSING));

    REQUIRE(!is_legal_transition(s::CACHED, s::DOWNLOADING));
    REQUIRE(!is_legal_transition(s::CACHED, s::FAILED));
    REQUIRE(!is_legal_transition(s::DOWNLOADING, s::DOWNLOADING));
    REQUIRE(!is_legal_transition(s::FAILED, s::CACHED));

    REQUIRE(string(get_entry_state_name(s::DOWNLOADING)) == "downloading");
}
