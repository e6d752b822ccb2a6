#include "Logger.h"
#include <iostream>
#include <csignal>
#include <pthread.h>

Logger::Logger() {}

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running.exchange(true))
        return;

    // The worker must never take SIGINT/SIGUSR1 away from the main thread
    sigset_t all, previous;
    sigfillset(&all);
    pthread_sigmask(SIG_SETMASK, &all, &previous);
    worker = std::thread(&Logger::run, this);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
}

void Logger::stop() {
    {
        // Under the lock, or the worker can miss the wakeup
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();

    if (worker.joinable())
        worker.join();
}

void Logger::log(const std::string& msg) {
    push(msg, false);
}

void Logger::error(const std::string& msg) {
    push(msg, true);
}

void Logger::push(std::string msg, bool toStderr) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running.load()) {
            // Not started (or already stopped): write through
            (toStderr ? std::cerr : std::cout) << msg << std::endl;
            return;
        }
        messages.push({ std::move(msg), toStderr });
    }
    cv.notify_one();
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(mtx);
    drained.wait(lock, [&]() {
        return (messages.empty() && !writing) || !worker.joinable();
        });
    std::cout.flush();
    std::cerr.flush();
}

void Logger::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running.load() || !messages.empty()) {
        cv.wait(lock, [&]() {
            return !messages.empty() || !running.load();
            });

        while (!messages.empty()) {
            Entry entry = std::move(messages.front());
            messages.pop();
            writing = true;

            lock.unlock();
            (entry.toStderr ? std::cerr : std::cout) << entry.text << std::endl;
            lock.lock();

            writing = false;
        }
        drained.notify_all();
    }
    drained.notify_all();
}
