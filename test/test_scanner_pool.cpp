#include <catch2/catch.hpp>
#include <bru/decode.h>
#include <bru/scanner_pool.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace bru;

TEST_CASE("Released scanners are reused", "[scanner_pool][unit]") {
    ScannerPool pool;
    REQUIRE(pool.idle() == 0);

    Scanner* first = nullptr;
    {
        auto lease = pool.acquire();
        first = &*lease;
        REQUIRE(pool.idle() == 0);
    }
    REQUIRE(pool.idle() == 1);

    auto again = pool.acquire();
    REQUIRE(&*again == first);
    REQUIRE(pool.idle() == 0);
}

TEST_CASE("Scanners come back from the pool reset", "[scanner_pool][unit]") {
    ScannerPool pool;
    {
        auto lease = pool.acquire();
        lease->step('m');
        lease->step('#');
        REQUIRE(lease->bytes() == 2);
    }
    {
        auto lease = pool.acquire();
        for (char c : std::string("meta ")) lease->step(c);
        REQUIRE(lease->step('[') == Opcode::Error);
        REQUIRE(lease->failed());
    }
    auto lease = pool.acquire();
    REQUIRE_FALSE(lease->failed());
    REQUIRE(lease->bytes() == 0);
    REQUIRE(lease->depth() == 0);
}

TEST_CASE("The pool keeps at most max_idle scanners", "[scanner_pool][unit]") {
    ScannerPool pool(2);
    {
        auto a = pool.acquire();
        auto b = pool.acquire();
        auto c = pool.acquire();
    }
    REQUIRE(pool.idle() == 2);
}

TEST_CASE("A moved lease returns its scanner once", "[scanner_pool][unit]") {
    ScannerPool pool;
    {
        auto a = pool.acquire();
        ScannerPool::Lease b(std::move(a));
        REQUIRE(b->step('m') == Opcode::BeginTag);
    }
    REQUIRE(pool.idle() == 1);
}

TEST_CASE("Concurrent validation shares the global pool", "[scanner_pool][threads]") {
    const std::string good = "meta {\n  name: ping\n}\n\nget {\n  url: https://example.com\n}\n";
    const std::string bad = "meta {\n  name: ping\n";

    std::atomic<int> valid{0};
    std::atomic<int> invalid{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                if (is_valid_bru((i + t) % 2 == 0 ? good : bad)) {
                    ++valid;
                } else {
                    ++invalid;
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(valid.load() == 800);
    REQUIRE(invalid.load() == 800);
    REQUIRE(ScannerPool::global().idle() >= 1);
    REQUIRE(ScannerPool::global().idle() <= 8);
}

TEST_CASE("Concurrent leases from one pool never share a scanner", "[scanner_pool][threads]") {
    ScannerPool pool;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                auto lease = pool.acquire();
                for (char c : std::string("tests {\n  ok\n}")) {
                    if (lease->step(c) == Opcode::Error) ++failures;
                }
                if (lease->eof() != Opcode::End) ++failures;
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE(failures.load() == 0);
    REQUIRE(pool.idle() <= 4);
}
