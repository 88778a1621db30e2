#include "relpack/fetch.hpp"

#include "test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <iterator>

namespace fs = std::filesystem;

static std::string read_bytes(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static std::string file_url(const fs::path& path)
{
    return "file://" + fs::absolute(path).generic_string();
}

int main()
{
    ScratchDir dir("curl");
    relpack::fetch::CurlDownloader downloader;

    std::cout << "Test: file:// download copies the bytes...\n";
    {
        std::string payload = "release archive\n";
        payload.push_back('\0');
        payload += "\x1f\x8b binary tail";
        write_file(dir.path() / "served" / "mpm-linux-amd64.tar.gz", payload);

        const auto dest = dir.path() / "mpm.tar.gz";
        downloader.download(file_url(dir.path() / "served" / "mpm-linux-amd64.tar.gz"), dest);
        assert(read_bytes(dest) == payload);

        // Overwrites a previous download instead of appending
        downloader.download(file_url(dir.path() / "served" / "mpm-linux-amd64.tar.gz"), dest);
        assert(fs::file_size(dest) == payload.size());
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: missing source raises FetchError naming the URL...\n";
    {
        const auto url = file_url(dir.path() / "served" / "mpm-darwin-arm64.tar.gz");
        bool threw = false;
        try
        {
            downloader.download(url, dir.path() / "missing.tar.gz");
        }
        catch (const FetchError& e)
        {
            threw = true;
            assert(std::string(e.what()).find(url) != std::string::npos);
        }
        assert(threw);
        std::cout << "  [PASS]\n";
    }

    std::cout << "Test: unwritable destination raises FetchError...\n";
    {
        bool threw = false;
        try
        {
            downloader.download(file_url(dir.path() / "served" / "mpm-linux-amd64.tar.gz"),
                                dir.path() / "no-such-dir" / "mpm.tar.gz");
        }
        catch (const FetchError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "  [PASS]\n";
    }

    return 0;
}
