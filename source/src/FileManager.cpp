#include "FileManager.hpp"
#include "Errors.hpp"

#include <fstream>

std::vector<Chunk> FileManager::load_chunks(const std::filesystem::path& path, size_t batch_size) {
    std::error_code ec;

    if (!std::filesystem::exists(path, ec) || ec) throw FileNotFound(path.string());
    if (!std::filesystem::is_regular_file(path, ec) || ec) throw FileUnreadable(path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw FileUnreadable(path.string());

    std::vector<Chunk> chunks;

    while (true) {
        Chunk batch(batch_size);
        in.read(reinterpret_cast<char*>(batch.data()), static_cast<std::streamsize>(batch_size));

        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;

        batch.resize(got);
        chunks.push_back(std::move(batch));

        if (got < batch_size) break;
    }

    if (in.bad()) throw FileUnreadable(path.string());

    return chunks;
}

std::optional<std::string> FileManager::write_chunks(const std::filesystem::path& path, const std::vector<Chunk>& chunks) {
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return "Could not create " + path.parent_path().string() + ": " + ec.message();

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return "Could not open " + path.string() + " for writing";

    for (const auto& chunk: chunks) {
        out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        if (!out) return "Write failed for " + path.string();
    }

    out.flush();
    if (!out) return "Flush failed for " + path.string();

    return std::nullopt;
}

std::optional<std::filesystem::path> FileManager::destination_for(std::string_view file_id) const {
    auto name = std::filesystem::path(file_id).filename();
    if (name.empty() || name == "." || name == "..") return std::nullopt;

    return _download_dir / name;
}

void FileManager::enqueue_assembly(std::filesystem::path dest, std::vector<Chunk>&& chunks, AssemblyCallback cb) {
    {
        std::scoped_lock lock(queue_mutex);

        if (stopping) {
            boost::asio::post(net_exec, [cb = std::move(cb)]() mutable { cb("Disk worker stopped"); });
            return;
        }

        write_queue.push(AssemblyJob{ std::move(dest), std::move(chunks), std::move(cb) });
    }
    cv.notify_one();
}

void FileManager::stop() {
    {
        std::scoped_lock lock(queue_mutex);
        stopping = true;
    }
    cv.notify_all();

    if (worker.joinable()) worker.join();
}

void FileManager::worker_loop() {
    while (true) {
        AssemblyJob job;

        {
            std::unique_lock lock(queue_mutex);
            cv.wait(lock, [&] { return stopping || !write_queue.empty(); });

            if (write_queue.empty()) break;

            job = std::move(write_queue.front());
            write_queue.pop();
        }

        auto error = write_chunks(job.dest, job.chunks);

        boost::asio::post(
            net_exec,
            [cb = std::move(job.callback), error = std::move(error)]() mutable {
                cb(std::move(error));
            }
        );
    }
}
