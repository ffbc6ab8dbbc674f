#include "sgnet/eventloop/EventLoop.hpp"
#include "sgnet/eventloop/EventLoopHandler.hpp"
#include "sgnet/log/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/eventfd.h>
#include <sys/epoll.h>
#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace sgnet {

namespace {

constexpr int kEpollMaxEvents = 64;
constexpr uint32_t kSlotCapacity = 1024;
constexpr uint32_t kFdTableHardCap = 8192;
constexpr uint32_t kWakeupFdEvents = EPOLLIN | EPOLLERR | EPOLLHUP;

uint32_t computeFdTableMax() {
    struct rlimit rl {};
    if (getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY) {
        return kFdTableHardCap;
    }
    return static_cast<uint32_t>(
        std::min<uint64_t>(static_cast<uint64_t>(rl.rlim_cur), kFdTableHardCap));
}

void drainEventFd(int fd) noexcept {
    uint64_t counter = 0;
    while (::read(fd, &counter, sizeof(counter)) == static_cast<ssize_t>(sizeof(counter))) {
    }
}

std::runtime_error errnoError(const char* what) {
    return std::runtime_error(std::string(what) + ": " + std::strerror(errno));
}

}  // namespace

// -----------------------------------------------------------------------------
// Registration
// -----------------------------------------------------------------------------

EventLoop::Registration::Registration(EventLoop* loop, int fd) noexcept
    : loop_(loop), fd_(fd) {}

EventLoop::Registration::Registration(Registration&& other) noexcept
    : loop_(std::exchange(other.loop_, nullptr)), fd_(std::exchange(other.fd_, -1)) {}

EventLoop::Registration& EventLoop::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        loop_ = std::exchange(other.loop_, nullptr);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

EventLoop::Registration::~Registration() {
    reset();
}

void EventLoop::Registration::reset() noexcept {
    if (loop_ == nullptr || fd_ < 0) {
        loop_ = nullptr;
        fd_ = -1;
        return;
    }
    try {
        loop_->unregisterFd(fd_);
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("unregister of fd ", fd_, " failed: ", ex.what());
    }
    loop_ = nullptr;
    fd_ = -1;
}

int EventLoop::Registration::fd() const noexcept {
    return fd_;
}

EventLoop::Registration::operator bool() const noexcept {
    return loop_ != nullptr && fd_ >= 0;
}

// -----------------------------------------------------------------------------
// Slots and tokens
// -----------------------------------------------------------------------------

uint64_t EventLoop::makeToken(uint32_t slot_id, uint32_t generation) noexcept {
    return (uint64_t{generation} << 32) | uint64_t{slot_id};
}

uint32_t EventLoop::allocSlot() {
    if (free_head_ == kInvalidSlot) {
        throw std::runtime_error("event loop slot pool exhausted");
    }
    const uint32_t slot_id = free_head_;
    free_head_ = slots_[slot_id].next_free;
    slots_[slot_id].next_free = kInvalidSlot;
    return slot_id;
}

void EventLoop::freeSlot(uint32_t slot_id) noexcept {
    Slot& slot = slots_[slot_id];
    slot.ptr = nullptr;
    slot.generation++;
    slot.fd = -1;
    slot.owns_fd = true;
    slot.next_free = free_head_;
    free_head_ = slot_id;
}

// -----------------------------------------------------------------------------
// Lifetime
// -----------------------------------------------------------------------------

EventLoop::EventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        throw errnoError("epoll_create1");
    }

    fd_to_slot_.assign(static_cast<size_t>(computeFdTableMax()) + 1, kInvalidSlot);

    slots_.resize(kSlotCapacity);
    for (uint32_t i = 0; i < kSlotCapacity; ++i) {
        slots_[i].next_free = (i + 1 < kSlotCapacity) ? (i + 1) : kInvalidSlot;
    }
    free_head_ = 0;

    wakeup_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ < 0) {
        const std::runtime_error error = errnoError("eventfd");
        ::close(epoll_fd_);
        throw error;
    }

    wakeup_handler_ = std::make_unique<WakeupHandler>(wakeup_fd_);
    registerFd(wakeup_fd_, wakeup_handler_.get(), kWakeupFdEvents, FdOwnership::Owned);
}

EventLoop::~EventLoop() {
    flushDeferredCloseFds();
    for (size_t fd = 0; fd < fd_to_slot_.size(); ++fd) {
        const uint32_t slot_id = fd_to_slot_[fd];
        if (slot_id == kInvalidSlot) {
            continue;
        }
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, static_cast<int>(fd), nullptr);
        if (slots_[slot_id].owns_fd) {
            ::close(static_cast<int>(fd));
        }
    }
    ::close(epoll_fd_);
    epoll_fd_ = -1;
}

// -----------------------------------------------------------------------------
// Registration table
// -----------------------------------------------------------------------------

EventLoop::Registration EventLoop::registerFdScoped(int fd,
                                                    EventLoopHandler* handler,
                                                    uint32_t events,
                                                    FdOwnership ownership) {
    registerFd(fd, handler, events, ownership);
    return Registration(this, fd);
}

void EventLoop::registerFd(int fd, EventLoopHandler* handler, uint32_t events, FdOwnership ownership) {
    if (fd < 0 || static_cast<size_t>(fd) >= fd_to_slot_.size()) {
        throw std::out_of_range("fd is outside the preallocated fd table");
    }
    if (fd_to_slot_[fd] != kInvalidSlot) {
        throw std::runtime_error("fd is already registered");
    }
    if (handler == nullptr) {
        throw std::invalid_argument("handler must not be null");
    }

    const uint32_t slot_id = allocSlot();
    Slot& slot = slots_[slot_id];
    slot.ptr = handler;
    slot.fd = fd;
    slot.owns_fd = (ownership == FdOwnership::Owned);

    struct epoll_event ev {};
    ev.events = (events == 0) ? kDefaultEvents : events;
    ev.data.u64 = makeToken(slot_id, slot.generation);

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        const std::runtime_error error = errnoError("epoll_ctl ADD");
        freeSlot(slot_id);
        throw error;
    }

    fd_to_slot_[fd] = slot_id;
}

void EventLoop::unregisterFd(int fd) {
    if (fd < 0 || static_cast<size_t>(fd) >= fd_to_slot_.size()) {
        return;
    }

    const uint32_t slot_id = fd_to_slot_[fd];
    if (slot_id == kInvalidSlot || slot_id >= slots_.size() || slots_[slot_id].fd != fd) {
        return;
    }

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    if (slots_[slot_id].owns_fd) {
        if (in_dispatch_) {
            deferred_close_fds_.push_back(fd);
        } else {
            ::close(fd);
        }
    }

    fd_to_slot_[fd] = kInvalidSlot;
    freeSlot(slot_id);
}

void EventLoop::modifyFdEvents(int fd, uint32_t events) {
    if (fd < 0 || static_cast<size_t>(fd) >= fd_to_slot_.size()) {
        throw std::out_of_range("fd is outside the preallocated fd table");
    }

    const uint32_t slot_id = fd_to_slot_[fd];
    if (slot_id == kInvalidSlot || slot_id >= slots_.size()) {
        throw std::runtime_error("fd is not registered");
    }

    const Slot& slot = slots_[slot_id];
    if (slot.fd != fd || slot.ptr == nullptr) {
        throw std::runtime_error("fd registration is inconsistent");
    }

    struct epoll_event ev {};
    ev.events = events;
    ev.data.u64 = makeToken(slot_id, slot.generation);

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        throw errnoError("epoll_ctl MOD");
    }
}

// -----------------------------------------------------------------------------
// Posted tasks
// -----------------------------------------------------------------------------

void EventLoop::post(Task task) {
    if (!task) {
        throw std::invalid_argument("posted task must not be empty");
    }
    {
        const std::lock_guard<std::mutex> lock(posted_mutex_);
        posted_tasks_.push_back(std::move(task));
    }
    wake();
}

void EventLoop::runPostedTasks() {
    std::deque<Task> batch;
    {
        const std::lock_guard<std::mutex> lock(posted_mutex_);
        batch.swap(posted_tasks_);
    }

    for (Task& task : batch) {
        try {
            task();
        } catch (const std::exception& ex) {
            SGNET_LOG_ERROR("posted task failed: ", ex.what());
        }
    }
}

// -----------------------------------------------------------------------------
// Main loop
// -----------------------------------------------------------------------------

void EventLoop::run() {
    struct epoll_event events[kEpollMaxEvents];
    loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
    running_.store(true, std::memory_order_release);

    // Tasks posted before run() started.
    runPostedTasks();

    while (running_.load(std::memory_order_acquire)) {
        const int n = epoll_wait(epoll_fd_, events, kEpollMaxEvents, -1);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            loop_thread_.store(std::thread::id{}, std::memory_order_release);
            throw errnoError("epoll_wait");
        }

        in_dispatch_ = true;
        for (int i = 0; i < n; ++i) {
            dispatch(events[i]);
            if (!running_.load(std::memory_order_acquire)) {
                break;
            }
        }
        in_dispatch_ = false;
        flushDeferredCloseFds();

        runPostedTasks();
    }

    loop_thread_.store(std::thread::id{}, std::memory_order_release);
}

void EventLoop::dispatch(const epoll_event& event) {
    const uint64_t token = event.data.u64;
    const auto slot_id = static_cast<uint32_t>(token);
    const auto generation = static_cast<uint32_t>(token >> 32);

    if (slot_id >= slots_.size()) {
        return;
    }

    const Slot& slot = slots_[slot_id];
    if (slot.generation != generation || slot.ptr == nullptr) {
        return;  // stale: slot was freed or reused after epoll_wait returned
    }
    slot.ptr->onEvent(event.events);
}

void EventLoop::flushDeferredCloseFds() noexcept {
    for (const int fd : deferred_close_fds_) {
        ::close(fd);
    }
    deferred_close_fds_.clear();
}

void EventLoop::stop() noexcept {
    running_.store(false, std::memory_order_release);
    wake();
}

bool EventLoop::isRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
}

bool EventLoop::isInLoopThread() const noexcept {
    return loop_thread_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

bool EventLoop::hasLoopThread() const noexcept {
    return loop_thread_.load(std::memory_order_acquire) != std::thread::id{};
}

void EventLoop::wake() noexcept {
    if (wakeup_fd_ < 0) {
        return;
    }

    const uint64_t signal = 1;
    if (::write(wakeup_fd_, &signal, sizeof(signal)) < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        // Counter saturated; the loop is already due to wake up.
        drainEventFd(wakeup_fd_);
        if (::write(wakeup_fd_, &signal, sizeof(signal)) < 0) {
            SGNET_LOG_WARN("eventfd wakeup write failed: ", std::strerror(errno));
        }
    }
}

EventLoop::WakeupHandler::WakeupHandler(int wakeup_fd) : wakeup_fd_(wakeup_fd) {}

void EventLoop::WakeupHandler::onEvent(uint32_t) noexcept {
    drainEventFd(wakeup_fd_);
}

}  // namespace sgnet
