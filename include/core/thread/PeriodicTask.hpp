#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace morph {
namespace core {
namespace thread {

/**
 * @brief Периодическая задача на отдельном потоке.
 * @details Вызывает callback каждые interval, пока не вызван stop().
 * Исключения из callback логируются и не останавливают таймер.
 * stop() идемпотентен и дожидается завершения текущего вызова.
 * start(), stop() и restart() из самого callback не ждут поток: остановка
 * и новый интервал применяются рабочим потоком после возврата из callback.
 */
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    explicit PeriodicTask(std::string name);
    ~PeriodicTask();

    // Запрет копирования
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // Запуск. Возвращает false, если задача уже запущена
    bool start(std::chrono::milliseconds interval, Callback callback);

    // Остановка. Безопасно вызывать повторно
    void stop();

    // Остановка и запуск с новыми параметрами как одна операция
    bool restart(std::chrono::milliseconds interval, Callback callback);

    bool isRunning() const;
    size_t tickCount() const;

private:
    void run();
    bool onWorkerThread() const;
    bool startLocked(std::chrono::milliseconds interval, Callback callback);
    void stopLocked();
    bool scheduleRestart(std::chrono::milliseconds interval, Callback callback, bool replaceRunning);
    void requestStopFromWorker();

    std::string name_;
    std::chrono::milliseconds interval_{0};
    Callback callback_;
    std::thread worker_;
    std::atomic<std::thread::id> workerId_{};
    std::mutex controlMutex_;       // Сериализует start/stop с внешних потоков
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stopRequested_ = false;
    bool joining_ = false;          // Внешний stop() ждёт поток
    // Перезапуск, запрошенный из callback
    bool restartPending_ = false;
    std::chrono::milliseconds pendingInterval_{0};
    Callback pendingCallback_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> ticks_{0};
};

} // namespace thread
} // namespace core
} // namespace morph
