#pragma once
#include <stdexcept>
#include <string>

namespace relpack
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

struct ToolNotFoundError : public Error
{
    explicit ToolNotFoundError(const std::string& tool)
        : Error("Missing command: " + tool), tool_(tool)
    {
    }

    const std::string& tool() const
    {
        return tool_;
    }

  private:
    std::string tool_;
};

struct CommandError : public Error
{
    using Error::Error;
};

struct BuildError : public Error
{
    using Error::Error;
};

struct FetchError : public Error
{
    using Error::Error;
};

} // namespace relpack
