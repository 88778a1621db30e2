#include "relpack/settings.hpp"

#include "relpack/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace relpack
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string uppercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// A single directory name: no separators, no drive, not "." or ".."
static bool is_plain_name(const std::string& name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\:") == std::string::npos;
}

// First component of a relative path, empty for absolute or escaping paths
static std::string top_component(const std::string& rel)
{
    const std::filesystem::path p = std::filesystem::path(rel).lexically_normal();
    if (p.empty() || p.has_root_path())
        return {};
    const std::string first = p.begin()->string();
    if (first == "..")
        return {};
    return first;
}

static bool parse_flag(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE" || v == "yes";
}

template <typename T>
static void read_key(const Json& j, const char* key, T& out)
{
    if (j.contains(key))
        out = j.at(key).get<T>();
}

BundleSpec BundleSpec::from_json(const Json& j)
{
    BundleSpec b;
    if (!j.is_object())
        throw ConfigError("'bundle' must be an object");
    try
    {
        read_key(j, "output_dir", b.output_dir);
        read_key(j, "product_name", b.product_name);
        read_key(j, "directories", b.directories);
        read_key(j, "files", b.files);
        read_key(j, "scripts", b.scripts);
        read_key(j, "ignore_patterns", b.ignore_patterns);
        read_key(j, "required_binaries", b.required_binaries);
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("Invalid bundle settings: ") + e.what());
    }
    return b;
}

void Settings::validate() const
{
    if (binary_name.empty())
        throw ConfigError("binary_name must not be empty");
    if (host_artifact_name.empty())
        throw ConfigError("host_artifact_name must not be empty");
    if (rust_artifact_candidates.empty())
        throw ConfigError("rust_artifact_candidates must name at least one binary");
    if (asset_prefix.empty())
        throw ConfigError("asset_prefix must not be empty");
    if (!is_plain_name(install_dir))
        throw ConfigError("install_dir must be a plain directory name");

    // output_dir is wiped on every package run and must stay a fresh child of the project root
    if (!is_plain_name(bundle.output_dir))
        throw ConfigError("bundle output_dir must be a plain directory name, got '" +
                          bundle.output_dir + "'");
    if (!is_plain_name(bundle.product_name))
        throw ConfigError("bundle product_name must be a plain directory name, got '" +
                          bundle.product_name + "'");
    for (const auto* inputs : {&bundle.directories, &bundle.files, &bundle.scripts})
    {
        for (const auto& input : *inputs)
        {
            const auto top = top_component(input);
            if (top.empty() || top == ".")
                throw ConfigError("bundle input '" + input +
                                  "' must be a relative path inside the project");
            if (top == bundle.output_dir)
                throw ConfigError("bundle input '" + input + "' lies inside output_dir '" +
                                  bundle.output_dir + "'");
        }
    }
}

void Settings::apply_env()
{
    log_level = uppercase(getenv_str("RELPACK_LOG_LEVEL", log_level));
    if (const char* v = std::getenv("RELPACK_STRICT"))
        strict = parse_flag(v);
    if (const char* v = std::getenv("RELPACK_PROJECT_ROOT"))
        project_root = v;
}

Settings Settings::from_env()
{
    Settings s;
    s.apply_env();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (!j.is_object())
        throw ConfigError("Configuration root must be a JSON object");
    try
    {
        read_key(j, "log_level", s.log_level);
        read_key(j, "strict", s.strict);
        read_key(j, "binary_name", s.binary_name);
        read_key(j, "go_module_dir", s.go_module_dir);
        read_key(j, "go_package", s.go_package);
        read_key(j, "release_dir", s.release_dir);
        read_key(j, "bin_dir", s.bin_dir);
        read_key(j, "rust_crate_dir", s.rust_crate_dir);
        read_key(j, "rust_artifact_candidates", s.rust_artifact_candidates);
        read_key(j, "host_artifact_name", s.host_artifact_name);
        read_key(j, "release_base_url", s.release_base_url);
        read_key(j, "asset_prefix", s.asset_prefix);
        read_key(j, "install_dir", s.install_dir);
        read_key(j, "fetched_binary", s.fetched_binary);

        if (j.contains("targets"))
        {
            s.targets.clear();
            for (const auto& t : j.at("targets"))
                s.targets.push_back(parse_target(t.get<std::string>()));
        }
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("Invalid settings: ") + e.what());
    }

    if (j.contains("bundle"))
        s.bundle = BundleSpec::from_json(j.at("bundle"));

    while (!s.release_base_url.empty() && s.release_base_url.back() == '/')
        s.release_base_url.pop_back();
    return s;
}

Settings Settings::from_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("Cannot open config file: " + path.string());

    Json j;
    try
    {
        in >> j;
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
    }
    return from_json(j);
}

Settings Settings::resolve()
{
    std::filesystem::path root = getenv_str("RELPACK_PROJECT_ROOT", ".");
    std::filesystem::path config = getenv_str("RELPACK_CONFIG", "");
    if (config.empty())
    {
        std::error_code ec;
        auto candidate = root / "relpack.json";
        if (std::filesystem::is_regular_file(candidate, ec))
            config = candidate;
    }

    Settings s = config.empty() ? Settings{} : from_file(config);
    s.project_root = root;
    s.apply_env();
    s.project_root = std::filesystem::absolute(s.project_root).lexically_normal();
    s.validate();
    return s;
}

} // namespace relpack
