#pragma once

#include <bru/scanner.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace bru {

// Thread-safe free list of scanners. Borrowed scanners are reset before they
// are handed out and returned to the pool when their lease is destroyed.
class ScannerPool {
public:
    class Lease {
    public:
        Lease(ScannerPool* pool, std::unique_ptr<Scanner> scanner)
            : pool_(pool), scanner_(std::move(scanner)) {}
        Lease(Lease&& other) noexcept = default;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        Scanner& operator*() { return *scanner_; }
        Scanner* operator->() { return scanner_.get(); }

    private:
        ScannerPool* pool_;
        std::unique_ptr<Scanner> scanner_;
    };

    explicit ScannerPool(size_t max_idle = 64) : max_idle_(max_idle) {}

    Lease acquire();

    // Number of idle scanners currently held.
    size_t idle() const;

    // Process-wide pool used by validate_bru().
    static ScannerPool& global();

private:
    void release(std::unique_ptr<Scanner> scanner);

    size_t max_idle_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Scanner>> free_;
};

}  // namespace bru
