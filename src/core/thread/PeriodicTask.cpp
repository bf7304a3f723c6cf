#include "core/thread/PeriodicTask.hpp"
#include "core/logging/LoggerFactory.hpp"

namespace morph {
namespace core {
namespace thread {

PeriodicTask::PeriodicTask(std::string name) : name_(std::move(name)) {}

PeriodicTask::~PeriodicTask() {
    stop();
    if (onWorkerThread() && worker_.joinable()) {
        // Задачу уничтожают из её же callback
        worker_.detach();
    }
}

bool PeriodicTask::start(std::chrono::milliseconds interval, Callback callback) {
    if (onWorkerThread()) {
        return scheduleRestart(interval, std::move(callback), false);
    }
    std::lock_guard<std::mutex> control(controlMutex_);
    return startLocked(interval, std::move(callback));
}

void PeriodicTask::stop() {
    if (onWorkerThread()) {
        requestStopFromWorker();
        return;
    }
    std::lock_guard<std::mutex> control(controlMutex_);
    stopLocked();
}

bool PeriodicTask::restart(std::chrono::milliseconds interval, Callback callback) {
    if (onWorkerThread()) {
        return scheduleRestart(interval, std::move(callback), true);
    }
    std::lock_guard<std::mutex> control(controlMutex_);
    stopLocked();
    return startLocked(interval, std::move(callback));
}

bool PeriodicTask::isRunning() const {
    return running_;
}

size_t PeriodicTask::tickCount() const {
    return ticks_;
}

bool PeriodicTask::startLocked(std::chrono::milliseconds interval, Callback callback) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        if (!stopRequested_) {
            return false;
        }
        // Остановлен из своего callback, поток ещё не присоединён
        lock.unlock();
        worker_.join();
        lock.lock();
    }
    interval_ = interval;
    callback_ = std::move(callback);
    stopRequested_ = false;
    joining_ = false;
    restartPending_ = false;
    running_ = true;
    // Поток не пройдёт ожидание, пока mutex_ не освобождён
    worker_ = std::thread([this] { run(); });
    workerId_ = worker_.get_id();
    logging::LoggerFactory::get("kvcache")->debug("Periodic task '{}' started, interval {}ms",
                                                   name_, interval_.count());
    return true;
}

void PeriodicTask::stopLocked() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stopRequested_ = true;
        joining_ = true;
        restartPending_ = false;
        pendingCallback_ = nullptr;
    }
    condition_.notify_all();
    worker_.join();
    workerId_ = std::thread::id();
    running_ = false;
    logging::LoggerFactory::get("kvcache")->debug("Periodic task '{}' stopped after {} ticks",
                                                   name_, ticks_.load());
}

bool PeriodicTask::scheduleRestart(std::chrono::milliseconds interval, Callback callback, bool replaceRunning) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (joining_ || (!replaceRunning && !stopRequested_)) {
        return false;
    }
    pendingInterval_ = interval;
    pendingCallback_ = std::move(callback);
    restartPending_ = true;
    stopRequested_ = false;
    running_ = true;
    logging::LoggerFactory::get("kvcache")->debug("Periodic task '{}' restart scheduled, interval {}ms",
                                                   name_, interval.count());
    return true;
}

void PeriodicTask::requestStopFromWorker() {
    std::lock_guard<std::mutex> lock(mutex_);
    restartPending_ = false;
    pendingCallback_ = nullptr;
    if (!stopRequested_) {
        // Цикл завершится после возврата из callback
        stopRequested_ = true;
        running_ = false;
        logging::LoggerFactory::get("kvcache")->debug("Periodic task '{}' stop requested from callback", name_);
    }
}

void PeriodicTask::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (condition_.wait_for(lock, interval_, [this] { return stopRequested_; })) {
                break;
            }
        }

        try {
            callback_();
        } catch (const std::exception& e) {
            logging::LoggerFactory::get("kvcache")->error("Periodic task '{}' failed: {}", name_, e.what());
        }
        ++ticks_;

        std::lock_guard<std::mutex> lock(mutex_);
        if (restartPending_) {
            interval_ = pendingInterval_;
            callback_ = std::move(pendingCallback_);
            pendingCallback_ = nullptr;
            restartPending_ = false;
        }
    }
    running_ = false;
}

bool PeriodicTask::onWorkerThread() const {
    return workerId_.load() == std::this_thread::get_id();
}

} // namespace thread
} // namespace core
} // namespace morph
