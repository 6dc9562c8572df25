#include "../src/core/SessionStore.hpp"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

int main() {
    CSessionStore store;

    assert(store.size() == 0);
    assert(store.cookiesFor("http://example.com/").empty());
    assert(store.cookieHeaderFor("http://example.com/").empty());

    {
        const auto STORED = store.store("http://example.com/cdn-cgi/l/chk_jschl?jschl_answer=1", {"cf_clearance=abc; Path=/; HttpOnly", "__cfduid=xyz"});
        assert(STORED == 2);
        assert(store.size() == 1);

        const auto COOKIES = store.cookiesFor("http://example.com/anything/else");
        assert(COOKIES.size() == 2);
        assert(COOKIES[0].name == "cf_clearance");
        assert(COOKIES[0].value == "abc");
        assert(COOKIES[1].name == "__cfduid");

        assert(store.cookieHeaderFor("HTTP://Example.COM/") == "cf_clearance=abc; __cfduid=xyz");
    }

    // keyed by scheme, host and port
    {
        assert(store.cookieHeaderFor("https://example.com/").empty());
        assert(store.cookieHeaderFor("http://example.com:8080/").empty());
        assert(store.cookieHeaderFor("http://www.example.com/").empty());
        assert(store.cookieHeaderFor("not a url").empty());
    }

    // a new solve replaces the whole set
    {
        assert(store.store("http://example.com/", {"cf_clearance=def"}) == 1);
        assert(store.size() == 1);
        assert(store.cookieHeaderFor("http://example.com/") == "cf_clearance=def");
    }

    // already expired cookies are not kept, and do not wipe what was there
    {
        assert(store.store("http://example.com/", {"cf_clearance=gone; Max-Age=0"}) == 0);
        assert(store.cookieHeaderFor("http://example.com/") == "cf_clearance=def");

        assert(store.store("http://example.com/", {"a=1; Max-Age=0", "b=2; Max-Age=60"}) == 1);
        assert(store.cookieHeaderFor("http://example.com/") == "b=2");
    }

    assert(store.store("not a url", {"a=1"}) == 0);

    {
        assert(store.store("https://example.org:8443/", {"k=v"}) == 1);
        assert(store.size() == 2);
        assert(store.cookieHeaderFor("https://example.org:8443/path") == "k=v");

        store.clear();
        assert(store.size() == 0);
        assert(store.cookieHeaderFor("https://example.org:8443/path").empty());
    }

    // concurrent solves and lookups
    {
        CSessionStore            shared;
        std::vector<std::thread> threads;

        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&shared, i]() {
                const std::string URL = "http://host" + std::to_string(i % 4) + ".test/";
                for (int j = 0; j < 200; ++j) {
                    shared.store(URL, {"cf_clearance=" + std::to_string(j)});
                    const auto HEADER = shared.cookieHeaderFor(URL);
                    assert(HEADER.starts_with("cf_clearance="));
                }
            });
        }

        for (auto& t : threads) {
            t.join();
        }

        assert(shared.size() == 4);
        assert(shared.cookieHeaderFor("http://host0.test/").starts_with("cf_clearance="));
    }

    return 0;
}
