/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized file I/O: log appends and atomic snapshots.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace psyche::infrastructure {

/**
 * @struct WriteTask
 * @brief Represents a single file write operation.
 */
struct WriteTask {
    enum class Mode { Append, Replace };

    std::string filename;
    std::string content;
    Mode mode = Mode::Append;
    std::shared_ptr<std::promise<bool>> done; // Set when a caller waits for durability
    std::function<void(const std::string&)> onFailure;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes sequentially.
 *
 * All writes pass through a single serialized queue, so appends to the same
 * log never interleave. Replace writes are atomic (temp file + rename).
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues text to be appended to a file.
     * @param onFailure Called from the worker thread with the file name if the write fails.
     */
    void appendTextAsync(const std::string& filename, const std::string& content,
                         std::function<void(const std::string&)> onFailure = nullptr);

    /**
     * @brief Appends text and waits until it has been flushed.
     * @return false if the write failed or the service is stopped.
     */
    bool appendText(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues a text content to replace a file atomically.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void enqueue(WriteTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    bool performAppend(const WriteTask& task);

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const WriteTask& task);

    // Thread Safety
    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace psyche::infrastructure
