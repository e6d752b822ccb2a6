#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>

class Logger {
public:
    Logger();
    ~Logger();

    void start();
    void stop();

    void log(const std::string& msg);
    void error(const std::string& msg);

    // Blocks until every queued message has been written.
    void flush();

private:
    struct Entry {
        std::string text;
        bool toStderr;
    };

    void push(std::string msg, bool toStderr);
    void run();

private:
    std::queue<Entry> messages;
    std::mutex mtx;
    std::condition_variable cv;
    std::condition_variable drained;
    std::atomic<bool> running{ false };
    bool writing{ false };
    std::thread worker;
};
