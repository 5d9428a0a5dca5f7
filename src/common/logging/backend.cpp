// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <atomic>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include <fmt/format.h>

#include "common/common_funcs.h"
#include "common/logging/backend.h"
#include "common/logging/log.h"
#include "common/logging/log_entry.h"
#include "common/logging/text_formatter.h"
#include "common/settings.h"

namespace Common::Log {

namespace {

/**
 * Interface for logging backends.
 */
class Backend {
public:
    virtual ~Backend() = default;

    virtual void Write(const Entry& entry) = 0;

    virtual void Flush() = 0;
};

/**
 * Backend that writes to stderr and with color
 */
class ColorConsoleBackend final : public Backend {
public:
    explicit ColorConsoleBackend() = default;

    ~ColorConsoleBackend() override = default;

    void Write(const Entry& entry) override {
        if (enabled.load(std::memory_order_relaxed)) {
            PrintColoredMessage(entry);
        }
    }

    void Flush() override {
        // stderr shouldn't be buffered
    }

    void SetEnabled(bool enabled_) {
        enabled = enabled_;
    }

private:
    std::atomic_bool enabled{false};
};

/**
 * Backend that writes to a file passed into the constructor
 */
class FileBackend final : public Backend {
public:
    explicit FileBackend(const std::filesystem::path& filename) {
        auto old_filename = filename;
        old_filename += ".old.txt";

        // Existence checks are done within the functions themselves.
        // We don't particularly care if these succeed or not.
        std::error_code ec;
        std::filesystem::remove(old_filename, ec);
        std::filesystem::rename(filename, old_filename, ec);

        file.reset(std::fopen(filename.string().c_str(), "w"));
        if (!file) {
            enabled = false;
        }
    }

    ~FileBackend() override = default;

    void Write(const Entry& entry) override {
        if (!enabled) {
            return;
        }

        const auto line = FormatLogMessage(entry).append(1, '\n');
        bytes_written += std::fwrite(line.data(), 1, line.size(), file.get());

        // Prevent logs from exceeding a set maximum size in the event that log entries are spammed.
        constexpr std::size_t write_limit = 100 * 1024 * 1024;
        const bool write_limit_exceeded = bytes_written > write_limit;
        if (entry.log_level >= Level::Error || write_limit_exceeded) {
            if (write_limit_exceeded) {
                // Stop writing after the write limit is exceeded.
                enabled = false;
            }
            std::fflush(file.get());
        }
    }

    void Flush() override {
        if (file) {
            std::fflush(file.get());
        }
    }

private:
    struct FileCloser {
        void operator()(std::FILE* fp) const {
            std::fclose(fp);
        }
    };

    std::unique_ptr<std::FILE, FileCloser> file;
    bool enabled = true;
    std::size_t bytes_written = 0;
};

/**
 * Unbounded multi-producer queue drained by the backend thread.
 */
class EntryQueue {
public:
    void Push(Entry&& entry) {
        {
            std::scoped_lock lk{mutex};
            queue.push_back(std::move(entry));
        }
        cv.notify_one();
    }

    bool PopWait(Entry& out_entry, std::stop_token stop_token) {
        std::unique_lock lk{mutex};
        if (!cv.wait(lk, stop_token, [this] { return !queue.empty(); })) {
            return false;
        }
        out_entry = std::move(queue.front());
        queue.pop_front();
        return true;
    }

    bool TryPop(Entry& out_entry) {
        std::scoped_lock lk{mutex};
        if (queue.empty()) {
            return false;
        }
        out_entry = std::move(queue.front());
        queue.pop_front();
        return true;
    }

private:
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Entry> queue;
};

bool initialization_in_progress_suppress_logging = true;

/**
 * Static state as a singleton.
 */
class Impl {
public:
    static Impl& Instance() {
        if (!instance) {
            throw std::runtime_error("Using Logging instance before its initialization");
        }
        return *instance;
    }

    static void Initialize() {
        if (instance) {
            LOG_WARNING(Log, "Reinitializing logging backend");
            return;
        }
        Filter filter;
        filter.ParseFilterString(Settings::values.log_filter.GetValue());
        instance = std::unique_ptr<Impl, decltype(&Deleter)>(
            new Impl(Settings::values.log_file.GetValue(), filter), Deleter);
        instance->SetColorConsoleBackendEnabled(Settings::values.use_color_console.GetValue());
        initialization_in_progress_suppress_logging = false;
    }

    static void Start() {
        if (instance) {
            instance->StartBackendThread();
        }
    }

    static void Stop() {
        if (instance) {
            instance->StopBackendThread();
        }
    }

    SYSVTZ_NON_COPYABLE(Impl);
    SYSVTZ_NON_MOVEABLE(Impl);

    void SetColorConsoleBackendEnabled(bool enabled) {
        color_console_backend.SetEnabled(enabled);
    }

    void PushEntry(Class log_class, Level log_level, const char* filename, unsigned int line_num,
                   const char* function, std::string&& message) {
        if (!filter.CheckMessage(log_class, log_level)) {
            return;
        }
        Entry entry =
            CreateEntry(log_class, log_level, filename, line_num, function, std::move(message));
        std::scoped_lock lk{write_mutex};
        if (!backend_running) {
            // Not started yet, or already stopped: write synchronously so nothing is lost.
            ForEachBackend([&entry](Backend& backend) { backend.Write(entry); });
            return;
        }
        message_queue.Push(std::move(entry));
    }

private:
    Impl(const std::string& file_backend_filename, const Filter& filter_) : filter{filter_} {
        if (!file_backend_filename.empty()) {
            file_backend = std::make_unique<FileBackend>(file_backend_filename);
        }
    }

    ~Impl() {
        StopBackendThread();
    }

    void StartBackendThread() {
        std::scoped_lock lk{write_mutex};
        if (backend_running) {
            return;
        }
        backend_thread = std::jthread([this](std::stop_token stop_token) {
            Entry entry;
            const auto write_logs = [this, &entry]() {
                std::scoped_lock lk{write_mutex};
                ForEachBackend([&entry](Backend& backend) { backend.Write(entry); });
            };
            while (!stop_token.stop_requested()) {
                if (message_queue.PopWait(entry, stop_token) && entry.filename != nullptr) {
                    write_logs();
                }
            }
            // Drain the logging queue. Only writes out up to MAX_LOGS_TO_WRITE to prevent a
            // case where a system is repeatedly spamming logs even on close.
            int max_logs_to_write = filter.IsDebug() ? INT_MAX : 100;
            while (max_logs_to_write-- && message_queue.TryPop(entry)) {
                write_logs();
            }
        });
        backend_running = true;
    }

    void StopBackendThread() {
        {
            std::scoped_lock lk{write_mutex};
            backend_running = false;
        }
        if (backend_thread.joinable()) {
            backend_thread.request_stop();
            backend_thread.join();
        }

        std::scoped_lock lk{write_mutex};
        ForEachBackend([](Backend& backend) { backend.Flush(); });
    }

    Entry CreateEntry(Class log_class, Level log_level, const char* filename, unsigned int line_nr,
                      const char* function, std::string&& message) const {
        using std::chrono::duration_cast;
        using std::chrono::microseconds;
        using std::chrono::steady_clock;

        return {
            .timestamp = duration_cast<microseconds>(steady_clock::now() - time_origin),
            .log_class = log_class,
            .log_level = log_level,
            .filename = filename,
            .line_num = line_nr,
            .function = function,
            .message = std::move(message),
        };
    }

    void ForEachBackend(auto lambda) {
        lambda(static_cast<Backend&>(color_console_backend));
        if (file_backend) {
            lambda(static_cast<Backend&>(*file_backend));
        }
    }

    static void Deleter(Impl* ptr) {
        delete ptr;
    }

    static inline std::unique_ptr<Impl, decltype(&Deleter)> instance{nullptr, Deleter};

    Filter filter;
    ColorConsoleBackend color_console_backend{};
    std::unique_ptr<FileBackend> file_backend;

    std::mutex write_mutex;
    EntryQueue message_queue{};
    std::chrono::steady_clock::time_point time_origin{std::chrono::steady_clock::now()};
    std::jthread backend_thread;
    bool backend_running = false; ///< Guarded by write_mutex
};
} // namespace

void Initialize() {
    Impl::Initialize();
}

void Start() {
    Impl::Start();
}

void Stop() {
    Impl::Stop();
}

void DisableLoggingInTests() {
    initialization_in_progress_suppress_logging = true;
}

void FmtLogMessageImpl(Class log_class, Level log_level, const char* filename,
                       unsigned int line_num, const char* function, const char* format,
                       const fmt::format_args& args) {
    if (!initialization_in_progress_suppress_logging) {
        Impl::Instance().PushEntry(log_class, log_level, filename, line_num, function,
                                   fmt::vformat(format, args));
    }
}
} // namespace Common::Log
