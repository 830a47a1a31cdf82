#include "common/semaphore.hpp"

namespace runbox {
using namespace std;

semaphore::semaphore(size_t capacity) : limit(capacity) {}

void semaphore::acquire() {
    unique_lock<mutex> mlock(mut);
    if (limit > 0)
        while (used >= limit) cond.wait(mlock);
    ++used;
}

bool semaphore::try_acquire() {
    unique_lock<mutex> mlock(mut);
    if (limit > 0 && used >= limit) return false;
    ++used;
    return true;
}

void semaphore::release() {
    unique_lock<mutex> mlock(mut);
    if (used > 0) --used;
    mlock.unlock();
    cond.notify_one();
}

size_t semaphore::capacity() const {
    return limit;
}

size_t semaphore::in_use() const {
    unique_lock<mutex> mlock(mut);
    return used;
}

semaphore_permit::semaphore_permit() : sem(nullptr) {}

semaphore_permit::semaphore_permit(semaphore &sem) : sem(&sem) {}

semaphore_permit::semaphore_permit(semaphore_permit &&other) noexcept : sem(other.sem) {
    other.sem = nullptr;
}

semaphore_permit::~semaphore_permit() {
    if (sem) sem->release();
}

}  // namespace runbox
