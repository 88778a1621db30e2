#include "relpack/exceptions.hpp"
#include "relpack/settings.hpp"

#include "test_helpers.hpp"

#include <cassert>
#include <cstdlib>

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value)
{
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

static void unset_env(const char* name)
{
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

int main()
{
    using namespace relpack;

    // Defaults reproduce the six-target matrix and the mpm layout
    Settings d;
    assert(d.targets.size() == 6);
    assert(d.binary_name == "mpm-go");
    assert(d.release_dir == "release_cross_platform");
    assert(d.rust_artifact_candidates.front() == "ast_indexer_rust");
    assert(!d.strict);

    // JSON parse
    auto s = Settings::from_json(Json{{"log_level", "debug"},
                                      {"strict", true},
                                      {"binary_name", "srv"},
                                      {"targets", Json::array({"linux/amd64", "windows/arm64"})},
                                      {"release_base_url", "https://example.com/dl/"},
                                      {"bundle", Json{{"product_name", "Demo"},
                                                      {"ignore_patterns", Json::array({"*.tmp"})}}}});
    assert(s.log_level == "debug");
    assert(s.strict);
    assert(s.binary_name == "srv");
    assert(s.targets.size() == 2);
    assert(s.targets[1] == (BuildTarget{Os::Windows, Arch::Arm64}));
    assert(s.release_base_url == "https://example.com/dl");
    assert(s.bundle.product_name == "Demo");
    assert(s.bundle.ignore_patterns.size() == 1);
    assert(s.bundle.output_dir == "mpm-release"); // untouched keys keep defaults

    // Bad target names are configuration errors
    bool threw = false;
    try
    {
        Settings::from_json(Json{{"targets", Json::array({"plan9/amd64"})}});
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);

    // Wrong value types are configuration errors, not json exceptions
    threw = false;
    try
    {
        Settings::from_json(Json{{"strict", "sometimes"}});
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);

    // Env parse (set locally)
    set_env("RELPACK_LOG_LEVEL", "warn");
    set_env("RELPACK_STRICT", "1");
    auto e = Settings::from_env();
    assert(e.log_level == "WARN"); // uppercased
    assert(e.strict);

    // Non-ASCII bytes pass through uppercasing untouched
    set_env("RELPACK_LOG_LEVEL", "warn\xc3\xa9");
    assert(Settings::from_env().log_level == "WARN\xc3\xa9");
    set_env("RELPACK_LOG_LEVEL", "warn");

    // Config file discovered under the project root, then env on top
    {
        ScratchDir root("settings");
        write_file(root.path() / "relpack.json",
                   R"({"binary_name": "from-file", "strict": false, "log_level": "ERROR"})");
        set_env("RELPACK_PROJECT_ROOT", root.path().string().c_str());
        auto r = Settings::resolve();
        assert(r.binary_name == "from-file");
        assert(r.strict);             // env wins
        assert(r.log_level == "WARN"); // env wins
        assert(r.project_root.is_absolute());

        write_file(root.path() / "relpack.json", "{ not json");
        threw = false;
        try
        {
            Settings::resolve();
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
    }

    // validate() rejects values that cannot drive a build
    Settings bad;
    bad.install_dir = "a/b";
    threw = false;
    try
    {
        bad.validate();
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);

    // Bundle output must be a fresh child of the project root, never an input or an outside path
    auto rejects_bundle = [](void (*mutate)(Settings&))
    {
        Settings s;
        mutate(s);
        try
        {
            s.validate();
        }
        catch (const ConfigError&)
        {
            return true;
        }
        return false;
    };
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "/tmp/elsewhere"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "."; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = ".."; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "out/bundle"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "out\\bundle"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "C:"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.output_dir = "docs"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.product_name = "/"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.product_name = ".."; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.product_name = "a/b"; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.directories = {"."}; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.directories = {"../sibling"}; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.directories = {"/etc"}; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.files = {"mpm-release/old.txt"}; }));
    assert(rejects_bundle([](Settings& s) { s.bundle.scripts = {"./mpm-release/x.sh"}; }));
    assert(rejects_bundle([](Settings& s) { s.install_dir = ".."; }));

    Settings renamed;
    renamed.bundle.output_dir = "dist";
    renamed.bundle.product_name = "Demo";
    renamed.bundle.directories = {"docs", "./mcp-server-go"};
    renamed.validate();

    unset_env("RELPACK_PROJECT_ROOT");
    unset_env("RELPACK_LOG_LEVEL");
    unset_env("RELPACK_STRICT");
    return 0;
}
