#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace runbox {

/**
 * @brief 计数信号量，限制同时进行的执行数量
 * capacity 为 0 时表示不限制，acquire 与 try_acquire 总是立即成功。
 */
struct semaphore {
    explicit semaphore(std::size_t capacity);

    /**
     * @brief 获取一个名额，没有空闲名额时阻塞等待
     */
    void acquire();

    /**
     * @brief 尝试获取一个名额
     * @return 是否获取成功，没有空闲名额时立即返回 false
     */
    bool try_acquire();

    /**
     * @brief 归还一个名额
     */
    void release();

    std::size_t capacity() const;

    /**
     * @brief 当前已被占用的名额数
     */
    std::size_t in_use() const;

private:
    const std::size_t limit;
    std::size_t used = 0;
    mutable std::mutex mut;
    std::condition_variable cond;
};

/**
 * @brief semaphore 名额的 RAII 持有者
 * 构造时接管一个已经获取到的名额，析构时归还。
 */
struct semaphore_permit {
    semaphore_permit();
    explicit semaphore_permit(semaphore &sem);
    semaphore_permit(semaphore_permit &&other) noexcept;
    semaphore_permit(const semaphore_permit &) = delete;
    ~semaphore_permit();

    semaphore_permit &operator=(const semaphore_permit &) = delete;

private:
    semaphore *sem;
};

}  // namespace runbox
