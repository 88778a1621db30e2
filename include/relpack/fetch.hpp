#pragma once
#include "relpack/logging.hpp"
#include "relpack/settings.hpp"
#include "relpack/target.hpp"
#include "relpack/toolchain.hpp"

#include <filesystem>
#include <string>

namespace relpack::fetch
{

enum class ArchiveFormat
{
    Zip,
    TarGz
};

inline std::string extension(ArchiveFormat format)
{
    switch (format)
    {
    case ArchiveFormat::Zip:
        return ".zip";
    case ArchiveFormat::TarGz:
        return ".tar.gz";
    }
    return ".tar.gz";
}

/// A pre-built release published for one platform.
struct ReleaseAsset
{
    std::string name;         ///< "mpm-darwin-arm64", also the archive's top-level directory
    ArchiveFormat format{ArchiveFormat::TarGz};
    std::string url;          ///< <base>/<name><ext>
    std::string archive_file; ///< local download name, "mpm.tar.gz"
};

/// Maps a host to the asset published for it.
///
/// Windows always gets the amd64 zip; darwin distinguishes arm64 from amd64;
/// every other host gets the linux amd64 tarball.
ReleaseAsset resolve_release_asset(const BuildTarget& host, const std::string& base_url,
                                   const std::string& prefix = "mpm");

class Downloader
{
  public:
    virtual ~Downloader() = default;
    /// Writes the body of `url` to `destination`. Throws FetchError.
    virtual void download(const std::string& url, const std::filesystem::path& destination) = 0;
};

/// libcurl-backed downloader; follows redirects, treats HTTP >= 400 as failure.
class CurlDownloader final : public Downloader
{
  public:
    CurlDownloader();
    ~CurlDownloader() override;

    CurlDownloader(const CurlDownloader&) = delete;
    CurlDownloader& operator=(const CurlDownloader&) = delete;

    void download(const std::string& url, const std::filesystem::path& destination) override;
};

class ArchiveExtractor
{
  public:
    virtual ~ArchiveExtractor() = default;
    /// Unpacks `archive` into `directory`. Throws FetchError.
    virtual void extract(const std::filesystem::path& archive, ArchiveFormat format,
                         const std::filesystem::path& directory) = 0;
};

/// Delegates to the system `tar` (bsdtar on Windows also reads zip).
class TarExtractor final : public ArchiveExtractor
{
  public:
    explicit TarExtractor(CommandRunner& runner) : runner_(runner) {}

    void extract(const std::filesystem::path& archive, ArchiveFormat format,
                 const std::filesystem::path& directory) override;

  private:
    CommandRunner& runner_;
};

/// Download, unpack and install the release for this host under a fixed directory name.
class ArtifactFetcher
{
  public:
    ArtifactFetcher(const Settings& settings, Downloader& downloader, ArchiveExtractor& extractor,
                    const Logger& logger, BuildTarget host = host_platform());

    /// @return the install directory, `<work_dir>/<install_dir>`
    std::filesystem::path fetch(const std::filesystem::path& work_dir);

  private:
    std::filesystem::path locate_extracted(const ReleaseAsset& asset,
                                           const std::filesystem::path& work_dir) const;
    std::filesystem::path install(const ReleaseAsset& asset,
                                  const std::filesystem::path& work_dir);

    const Settings& settings_;
    Downloader& downloader_;
    ArchiveExtractor& extractor_;
    const Logger& log_;
    BuildTarget host_;
};

} // namespace relpack::fetch
