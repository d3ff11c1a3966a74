#include <bru/scanner_pool.h>

namespace bru {

ScannerPool::Lease::~Lease() {
    if (pool_ and scanner_) pool_->release(std::move(scanner_));
}

ScannerPool::Lease ScannerPool::acquire() {
    std::unique_ptr<Scanner> scanner;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (not free_.empty()) {
            scanner = std::move(free_.back());
            free_.pop_back();
        }
    }
    if (not scanner) scanner = std::make_unique<Scanner>();
    scanner->reset();
    return Lease(this, std::move(scanner));
}

size_t ScannerPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

ScannerPool& ScannerPool::global() {
    static ScannerPool pool;
    return pool;
}

void ScannerPool::release(std::unique_ptr<Scanner> scanner) {
    // Drop memory held on behalf of pathological inputs.
    scanner->shrink();
    std::lock_guard<std::mutex> lock(mutex_);
    if (free_.size() < max_idle_) free_.push_back(std::move(scanner));
}

}  // namespace bru
