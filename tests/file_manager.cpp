#include "FileManager.hpp"
#include "Errors.hpp"

#include "LoopbackNetwork.hpp"

#include <cassert>
#include <fstream>
#include <iterator>

namespace {

std::string read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
}

}

int main() {
    test::TempDir dir("file-manager");

    // missing file
    {
        bool threw = false;
        try {
            (void)FileManager::load_chunks(dir.path / "nope.txt", 1500);
        }
        catch (const FileNotFound&) {
            threw = true;
        }
        assert(threw);
    }

    // a directory is not something we can send
    {
        bool threw = false;
        try {
            (void)FileManager::load_chunks(dir.path, 1500);
        }
        catch (const FileUnreadable&) {
            threw = true;
        }
        assert(threw);
    }

    // empty file, no chunks
    {
        std::ofstream(dir.path / "empty.txt").close();
        assert(FileManager::load_chunks(dir.path / "empty.txt", 1500).empty());
    }

    // exact multiple of the batch size has no trailing empty chunk
    {
        std::ofstream(dir.path / "even.bin", std::ios::binary) << std::string(3000, 'e');
        auto chunks = FileManager::load_chunks(dir.path / "even.bin", 1500);
        assert(chunks.size() == 2);
        assert(chunks[1].size() == 1500);
    }

    boost::asio::io_context ioc;
    FileManager fm(dir.path / "downloads", ioc.get_executor());

    // remote names are reduced to their base name
    {
        assert(fm.destination_for("report.pdf") == dir.path / "downloads" / "report.pdf");
        assert(fm.destination_for("../../etc/passwd") == dir.path / "downloads" / "passwd");
        assert(!fm.destination_for(""));
        assert(!fm.destination_for(".."));
        assert(!fm.destination_for("."));
    }

    // assembly happens on the disk worker, the callback on the io_context
    {
        std::vector<Chunk> chunks{ Chunk{ 'h', 'e', 'l' }, Chunk{ 'l', 'o' } };

        auto dest = *fm.destination_for("hello.txt");

        bool called = false;
        std::optional<std::string> result{ "unset" };

        fm.enqueue_assembly(dest, std::move(chunks), [&](std::optional<std::string> error) {
            called = true;
            result = std::move(error);
        });

        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!called && std::chrono::steady_clock::now() < until) {
            ioc.restart();
            ioc.run_for(std::chrono::milliseconds(5));
        }

        assert(called);
        assert(!result);
        assert(read_all(dest) == "hello");
    }

    // an unwritable destination reports instead of throwing
    {
        auto blocker = dir.path / "blocker";
        std::ofstream(blocker) << "x";

        auto error = FileManager::write_chunks(blocker / "inside.txt", { Chunk{ 'x' } });
        assert(error);
    }

    // stopped worker refuses new work through the callback
    {
        fm.stop();

        bool called = false;
        std::optional<std::string> result;

        fm.enqueue_assembly(dir.path / "downloads" / "late.txt", {}, [&](std::optional<std::string> error) {
            called = true;
            result = std::move(error);
        });

        ioc.restart();
        ioc.run_for(std::chrono::milliseconds(20));

        assert(called);
        assert(result);
        assert(!std::filesystem::exists(dir.path / "downloads" / "late.txt"));
    }

    return 0;
}
