#pragma once
#include <stdexcept>

namespace sbp {

// One-shot algorithm lifecycle: start() runs once, kill() releases run state
class Algorithm {
public:
    virtual ~Algorithm() = default;

    void start() {
        if (started_) {
            throw std::runtime_error("Algorithm::start: already started");
        }
        started_ = true;
        active_ = true;
        try {
            run();
        } catch (...) {
            active_ = false;
            throw;
        }
    }

    void kill() {
        cleanUp();
        active_ = false;
    }

    bool isActive() const { return active_; }

protected:
    virtual void run() = 0;
    virtual void cleanUp() {}

private:
    bool started_ = false;
    bool active_ = false;
};

} // namespace sbp
