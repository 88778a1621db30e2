#include "relpack/fetch.hpp"

#include "relpack/exceptions.hpp"
#include "relpack/util/files.hpp"
#include "relpack/version.hpp"

#include <algorithm>
#include <curl/curl.h>
#include <fstream>
#include <vector>

namespace relpack::fetch
{

namespace fs = std::filesystem;

ReleaseAsset resolve_release_asset(const BuildTarget& host, const std::string& base_url,
                                   const std::string& prefix)
{
    ReleaseAsset asset;
    if (host.os == Os::Windows)
    {
        asset.name = prefix + "-windows-amd64";
        asset.format = ArchiveFormat::Zip;
    }
    else if (host.os == Os::Darwin)
    {
        asset.name = prefix + (host.arch == Arch::Arm64 ? "-darwin-arm64" : "-darwin-amd64");
        asset.format = ArchiveFormat::TarGz;
    }
    else
    {
        asset.name = prefix + "-linux-amd64";
        asset.format = ArchiveFormat::TarGz;
    }

    std::string base = base_url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();

    asset.url = base + "/" + asset.name + extension(asset.format);
    asset.archive_file = prefix + extension(asset.format);
    return asset;
}

// =============================================================================
// CurlDownloader
// =============================================================================

CurlDownloader::CurlDownloader()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        throw FetchError("libcurl global init failed");
}

CurlDownloader::~CurlDownloader()
{
    curl_global_cleanup();
}

void CurlDownloader::download(const std::string& url, const fs::path& destination)
{
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out)
        throw FetchError("Cannot write " + destination.string());

    CURL* curl = curl_easy_init();
    if (!curl)
        throw FetchError("libcurl init failed");

    const std::string user_agent = std::string("relpack/") + VERSION_STRING;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(
        curl, CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t
        {
            auto* stream = static_cast<std::ofstream*>(userdata);
            stream->write(ptr, static_cast<std::streamsize>(size * nmemb));
            return stream->good() ? size * nmemb : 0;
        });
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);

    CURLcode code = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);
    out.close();

    if (code != CURLE_OK)
    {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(code);
        throw FetchError("Download of " + url + " failed: " + detail);
    }
    if (status >= 400)
        throw FetchError("Download of " + url + " failed: HTTP " + std::to_string(status));
    if (!out)
        throw FetchError("Failed writing " + destination.string());
}

// =============================================================================
// TarExtractor
// =============================================================================

void TarExtractor::extract(const fs::path& archive, ArchiveFormat format,
                           const fs::path& directory)
{
    Command cmd;
    cmd.program = "tar";
    cmd.args = {format == ArchiveFormat::Zip ? "-xf" : "-xzf", archive.string()};
    cmd.working_directory = directory;

    if (!runner_.find_program("tar"))
        throw FetchError("Missing command: tar");

    int code = 0;
    try
    {
        code = runner_.run(cmd);
    }
    catch (const CommandError& e)
    {
        throw FetchError(std::string("Extraction failed: ") + e.what());
    }
    if (code != 0)
        throw FetchError("Extraction of " + archive.string() + " failed (tar exit code " +
                         std::to_string(code) + ")");
}

// =============================================================================
// ArtifactFetcher
// =============================================================================

ArtifactFetcher::ArtifactFetcher(const Settings& settings, Downloader& downloader,
                                 ArchiveExtractor& extractor, const Logger& logger,
                                 BuildTarget host)
    : settings_(settings), downloader_(downloader), extractor_(extractor), log_(logger),
      host_(host)
{
}

fs::path ArtifactFetcher::locate_extracted(const ReleaseAsset& asset,
                                           const fs::path& work_dir) const
{
    std::error_code ec;
    if (host_.os == Os::Windows)
    {
        auto dir = work_dir / asset.name;
        if (fs::is_directory(dir, ec))
            return dir;
        throw FetchError("Extracted directory " + asset.name + " not found in " +
                         work_dir.string());
    }

    const std::string wanted = settings_.asset_prefix + "-";
    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(work_dir))
    {
        const auto name = entry.path().filename().string();
        if (name == settings_.install_dir || name == asset.archive_file)
            continue;
        if (name.compare(0, wanted.size(), wanted) == 0 && entry.is_directory())
            candidates.push_back(entry.path());
    }
    if (candidates.empty())
        throw FetchError("No extracted " + wanted + "* directory found in " + work_dir.string());

    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

fs::path ArtifactFetcher::install(const ReleaseAsset& asset, const fs::path& work_dir)
{
    auto archive = work_dir / asset.archive_file;
    downloader_.download(asset.url, archive);
    log_.ok("Downloaded " + asset.archive_file + " (" +
            util::human_size(util::file_size_or_zero(archive)) + ")");

    extractor_.extract(archive, asset.format, work_dir);

    auto extracted = locate_extracted(asset, work_dir);
    auto target = work_dir / settings_.install_dir;

    std::error_code ec;
    if (fs::exists(target, ec))
    {
        log_.warn("Replacing existing " + target.string());
        fs::remove_all(target);
    }
    fs::rename(extracted, target);
    log_.ok("Installed " + extracted.filename().string() + " as " + settings_.install_dir);

    if (host_.os != Os::Windows)
    {
        auto binary = target / settings_.fetched_binary;
        if (!fs::is_regular_file(binary, ec))
            throw FetchError(settings_.fetched_binary + " not found in " + target.string());
        util::make_executable(binary);
    }
    return target;
}

fs::path ArtifactFetcher::fetch(const fs::path& work_dir)
{
    auto asset =
        resolve_release_asset(host_, settings_.release_base_url, settings_.asset_prefix);
    log_.step("Fetch pre-built release for " + to_string(host_));
    log_.info("Downloading native binary from: " + asset.url);

    fs::create_directories(work_dir);
    const auto archive = work_dir / asset.archive_file;

    fs::path installed;
    try
    {
        installed = install(asset, work_dir);
    }
    catch (const fs::filesystem_error& e)
    {
        std::error_code ec;
        fs::remove(archive, ec);
        throw FetchError(std::string("Install failed: ") + e.what());
    }
    catch (const Error&)
    {
        std::error_code ec;
        fs::remove(archive, ec);
        throw;
    }

    std::error_code ec;
    fs::remove(archive, ec);
    if (ec)
        log_.warn("Could not remove " + archive.string() + ": " + ec.message());

    log_.ok("Release ready in " + installed.string());
    return installed;
}

} // namespace relpack::fetch
