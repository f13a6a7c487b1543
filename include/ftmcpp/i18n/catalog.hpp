#pragma once
#include "ftmcpp/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace ftmcpp::i18n
{

/// gettext-style message catalog. Lookups that miss return the message id.
class Catalog
{
  public:
    Catalog() = default;
    explicit Catalog(std::string locale) : locale_(std::move(locale)) {}

    /// Build from a JSON object of {msgid: msgstr}. Non-string entries are rejected.
    static Catalog from_json(const Json& j, std::string locale = "en");

    const std::string& locale() const
    {
        return locale_;
    }

    void add(const std::string& msgid, const std::string& msgstr)
    {
        messages_[msgid] = msgstr;
    }

    std::string gettext(const std::string& msgid) const;
    std::optional<std::string> gettext_opt(const std::optional<std::string>& msgid) const;

    size_t size() const
    {
        return messages_.size();
    }

  private:
    std::string locale_{"en"};
    std::unordered_map<std::string, std::string> messages_;
};

} // namespace ftmcpp::i18n
