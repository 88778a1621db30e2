#include "relpack/target.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using namespace relpack;
    std::cout << "Test: artifact naming over the default matrix...\n";

    const auto matrix = default_matrix();
    assert(matrix.size() == 6);
    assert(to_string(matrix.front()) == "windows/amd64");
    assert(to_string(matrix.back()) == "darwin/arm64");

    for (const auto& t : matrix)
    {
        auto name = artifact_name("mpm-go", t);
        auto expected = "mpm-go-" + to_string(t.os) + "-" + to_string(t.arch);
        bool has_exe = name.size() > 4 && name.compare(name.size() - 4, 4, ".exe") == 0;

        // .exe if and only if the target OS is windows
        assert(has_exe == (t.os == Os::Windows));
        assert(name == (has_exe ? expected + ".exe" : expected));
    }

    assert(artifact_name("mpm-go", {Os::Linux, Arch::Amd64}) == "mpm-go-linux-amd64");
    assert(artifact_name("mpm-go", {Os::Windows, Arch::Arm64}) == "mpm-go-windows-arm64.exe");
    assert(artifact_name("tool", {Os::Darwin, Arch::Arm64}) == "tool-darwin-arm64");

    assert(executable_name("ast_indexer", Os::Windows) == "ast_indexer.exe");
    assert(executable_name("ast_indexer", Os::Darwin) == "ast_indexer");

    auto host = host_platform();
#if defined(_WIN32)
    assert(host.os == Os::Windows);
#elif defined(__APPLE__)
    assert(host.os == Os::Darwin);
#else
    assert(host.os == Os::Linux);
#endif
    (void)host;

    std::cout << "  [PASS] naming\n";
    return 0;
}
