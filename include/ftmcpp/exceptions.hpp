#pragma once
#include "ftmcpp/types.hpp"

#include <stdexcept>
#include <string>

namespace ftmcpp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Broken schema definition. Raised while loading and aborts the whole model.
struct InvalidModel : public Error
{
    using Error::Error;
};

/// Data rejected by a loaded schema. Carries every offending property at once.
struct InvalidData : public Error
{
    explicit InvalidData(const std::string& message, Json errors = Json::object())
        : Error(message), errors_(std::move(errors))
    {
    }

    /// Property name -> message.
    const Json& errors() const
    {
        return errors_;
    }

  private:
    Json errors_;
};

} // namespace ftmcpp
