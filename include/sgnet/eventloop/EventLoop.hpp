// SPDX-License-Identifier: MIT
//
// Single-threaded epoll event loop that drives deferred completion of
// scatter-gather sends.
//
// Handlers are addressed through a slot+generation token stored in
// epoll_event.data.u64 = (generation << 32) | slot_id. Freeing a slot bumps its
// generation, so an event read by epoll_wait for an fd that was unregistered
// (and whose slot was reused) before dispatch carries a stale generation and is
// dropped instead of reaching the new handler.
//
// Ownership: a registration either owns its fd (unregister closes it) or
// borrows it (unregister only removes it from epoll). Closing an owned fd from
// inside a dispatch batch is deferred to the end of the batch so later events
// of the same batch can never observe a recycled descriptor number.
//
// Cross-thread work: post() queues a task and signals an eventfd. The queue is
// drained on the loop thread, which makes post() the one safe way for another
// thread to touch loop-owned state (registrations, in-flight sends).
//
//   registerFd(fd, handler, events, owns):
//     slot_id = pop_free(); slot = {handler, fd, owns}
//     epoll_ctl(ADD, fd, token(slot_id, slot.generation))
//
//   unregisterFd(fd):
//     epoll_ctl(DEL, fd); owns ? close(fd) or defer : keep
//     slot.generation++; push_free(slot_id)
//
//   run():
//     loop: epoll_wait -> for each event: decode token, check generation,
//           dispatch; then close deferred fds and run posted tasks

#pragma once

#include "sgnet/eventloop/EventLoopHandler.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct epoll_event;

namespace sgnet {

class EventLoop {
public:
    using Task = std::function<void()>;

    enum class FdOwnership : uint8_t {
        Owned,
        Borrowed,
    };

    // Scoped registration. Destruction unregisters the fd (closing it when
    // the registration owns it).
    class Registration {
    public:
        Registration() = default;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        ~Registration();

        void reset() noexcept;
        int fd() const noexcept;
        explicit operator bool() const noexcept;

    private:
        friend class EventLoop;
        Registration(EventLoop* loop, int fd) noexcept;

        EventLoop* loop_ = nullptr;
        int fd_ = -1;
    };

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Default events (0) mean EPOLLIN | EPOLLOUT.
    Registration registerFdScoped(int fd,
                                  EventLoopHandler* handler,
                                  uint32_t events = kDefaultEvents,
                                  FdOwnership ownership = FdOwnership::Owned);

    // epoll_ctl(DEL), close when owned, invalidate the slot. Unknown fds are ignored.
    void unregisterFd(int fd);

    void modifyFdEvents(int fd, uint32_t events);

    // Queues `task` for the loop thread and wakes epoll_wait. Thread-safe.
    void post(Task task);

    // Blocks dispatching events and posted tasks until stop().
    void run();

    // Request loop shutdown and wake epoll_wait immediately. Thread-safe.
    void stop() noexcept;

    bool isRunning() const noexcept;
    bool isInLoopThread() const noexcept;
    // True from the start of run() until it returns, including the task
    // drain that follows stop().
    bool hasLoopThread() const noexcept;

private:
    static constexpr uint32_t kDefaultEvents = 0x001 | 0x004;

    class WakeupHandler : public EventLoopHandler {
    public:
        explicit WakeupHandler(int wakeup_fd);
        void onEvent(uint32_t event_mask) noexcept override;

    private:
        int wakeup_fd_ = -1;
    };

    static constexpr uint32_t kInvalidSlot = UINT32_MAX;

    struct Slot {
        EventLoopHandler* ptr = nullptr;
        uint32_t generation = 0;
        int fd = -1;
        bool owns_fd = true;
        uint32_t next_free = kInvalidSlot;
    };

    static uint64_t makeToken(uint32_t slot_id, uint32_t generation) noexcept;

    uint32_t allocSlot();
    void freeSlot(uint32_t slot_id) noexcept;
    void registerFd(int fd, EventLoopHandler* handler, uint32_t events, FdOwnership ownership);
    void dispatch(const epoll_event& event);
    void flushDeferredCloseFds() noexcept;
    void runPostedTasks();
    void wake() noexcept;

    int epoll_fd_ = -1;
    int wakeup_fd_ = -1;
    std::unique_ptr<WakeupHandler> wakeup_handler_;
    std::vector<Slot> slots_;
    uint32_t free_head_ = kInvalidSlot;
    std::vector<uint32_t> fd_to_slot_;
    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> loop_thread_{};
    bool in_dispatch_ = false;
    std::vector<int> deferred_close_fds_;

    std::mutex posted_mutex_;
    std::deque<Task> posted_tasks_;
};

}  // namespace sgnet
