#pragma once

#include <filesystem>
#include <mutex>
#include <queue>
#include <thread>
#include <optional>
#include <condition_variable>
#include <atomic>
#include <functional>

#include <boost/asio.hpp>

using Chunk = std::vector<unsigned char>;

// owns the disk worker, assembled files are written off the network threads
class FileManager {
public:
    // empty error means the file is on disk
    using AssemblyCallback = std::move_only_function<void(std::optional<std::string> error)>;

    FileManager(std::filesystem::path download_dir, boost::asio::any_io_executor exec): _download_dir(std::move(download_dir)), net_exec(exec) {
        worker = std::thread(&FileManager::worker_loop, this);
    }

    ~FileManager() noexcept { stop(); }

    FileManager(const FileManager&) = delete;
    FileManager& operator=(const FileManager&) = delete;

    // throws FileNotFound / FileUnreadable, last chunk may be short, an empty file has no chunks
    static std::vector<Chunk> load_chunks(const std::filesystem::path& path, size_t batch_size);

    // writes chunks back to back, returns the error text on failure
    static std::optional<std::string> write_chunks(const std::filesystem::path& path, const std::vector<Chunk>& chunks);

    // base name only, a remote name can never leave the download directory
    std::optional<std::filesystem::path> destination_for(std::string_view file_id) const;

    void enqueue_assembly(std::filesystem::path dest, std::vector<Chunk>&& chunks, AssemblyCallback cb);

    // drains pending writes, then joins the worker
    void stop();

private:
    struct AssemblyJob {
        std::filesystem::path dest;
        std::vector<Chunk> chunks;
        AssemblyCallback callback;
    };

    std::filesystem::path _download_dir;
    boost::asio::any_io_executor net_exec;

    std::thread worker;
    std::queue<AssemblyJob> write_queue;

    std::mutex queue_mutex;
    std::condition_variable cv;
    bool stopping = false;

    void worker_loop();
};
