#include "linkchat/Types.hpp"
#include "linkchat/storage/ReceiveDirectory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace linkchat;
using namespace linkchat::storage;

namespace {

std::filesystem::path make_temp_dir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
    std::filesystem::create_directories(path);
    return path;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

}  // namespace

int main() {
    {
        assert(sanitize_relative_path("notes.txt") == std::string("notes.txt"));
        assert(sanitize_relative_path("docs/./a//b.txt") == std::string("docs/a/b.txt"));
        assert(sanitize_relative_path("docs\\win\\c.txt") == std::string("docs/win/c.txt"));
        assert(!sanitize_relative_path("").has_value());
        assert(!sanitize_relative_path("/etc/passwd").has_value());
        assert(!sanitize_relative_path("\\root").has_value());
        assert(!sanitize_relative_path("../escape.txt").has_value());
        assert(!sanitize_relative_path("docs/../../escape.txt").has_value());
        assert(!sanitize_relative_path("./.").has_value());
    }

    const auto root = make_temp_dir("linkchat_receive_directory");

    // Sinks create parent folders, truncate, and stay inside the root.
    {
        ReceiveDirectory directory(root / "inbox");
        assert(!directory.resolve("../x").has_value());
        assert(directory.resolve("a/b.txt") == directory.root() / "a/b.txt");
        assert(directory.create_folder("album/2024"));
        assert(std::filesystem::is_directory(root / "inbox" / "album" / "2024"));
        assert(!directory.create_folder("../outside"));

        {
            auto sink = directory.open_sink("album/cover.bin");
            assert(sink != nullptr && sink->is_open());
            const ByteBuffer data{1, 2, 3, 4};
            assert(sink->write(data));
            assert(sink->close());
        }
        {
            auto sink = directory.open_sink("album/cover.bin");
            const ByteBuffer data{9};
            assert(sink->write(data));
            assert(sink->close());
        }
        assert(read_file_bytes(root / "inbox" / "album" / "cover.bin") == ByteBuffer{9});
        assert(directory.open_sink("/absolute.bin") == nullptr);

        const auto factory = directory.sink_factory();
        auto sink = factory(MacAddress{}, "from_factory.txt");
        assert(sink != nullptr);
        const ByteBuffer data{'o', 'k'};
        assert(sink->write(data));
        assert(sink->close());
        assert(read_file_bytes(root / "inbox" / "from_factory.txt") == data);
        assert(factory(MacAddress{}, "../nope.txt") == nullptr);
    }

    assert(!read_file_bytes(root / "missing.bin").has_value());

    // Files of a folder come first in name order, then sub-folders recursively.
    {
        const auto tree = root / "project";
        write_text(tree / "b.txt", "bee");
        write_text(tree / "a.txt", "ay");
        write_text(tree / "src" / "main.cpp", "int main() {}");
        write_text(tree / "docs" / "guide.md", "# guide");
        std::filesystem::create_directories(tree / "empty");

        const auto entries = walk_folder(tree);
        std::vector<std::string> rendered;
        for (const auto& entry : entries) {
            switch (entry.kind) {
                case FolderEntry::Kind::FolderStart:
                    rendered.push_back("+" + entry.relative_path);
                    break;
                case FolderEntry::Kind::File:
                    rendered.push_back(entry.relative_path);
                    break;
                case FolderEntry::Kind::FolderEnd:
                    rendered.push_back("-" + entry.relative_path);
                    break;
            }
        }
        const std::vector<std::string> expected{
            "+project",
            "project/a.txt",
            "project/b.txt",
            "+project/docs",
            "project/docs/guide.md",
            "-project/docs",
            "+project/empty",
            "-project/empty",
            "+project/src",
            "project/src/main.cpp",
            "-project/src",
            "-project",
        };
        assert(rendered == expected);
        assert(entries[1].source == tree / "a.txt");

        const auto trailing = walk_folder(tree / "");
        assert(trailing.front().relative_path == "project");

        bool threw = false;
        try {
            walk_folder(tree / "a.txt");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::filesystem::remove_all(root);
    return 0;
}
