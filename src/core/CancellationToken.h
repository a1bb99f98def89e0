#pragma once
#include <atomic>
#include <memory>

namespace iperf_discovery {

// Copies share one flag; cancel() is safe from any thread.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
