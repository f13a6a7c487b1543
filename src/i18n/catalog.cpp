#include "ftmcpp/i18n/catalog.hpp"

#include "ftmcpp/exceptions.hpp"

namespace ftmcpp::i18n
{

Catalog Catalog::from_json(const Json& j, std::string locale)
{
    if (!j.is_object())
        throw Error("message catalog must be a JSON object");
    Catalog catalog(std::move(locale));
    for (const auto& [msgid, msgstr] : j.items())
    {
        if (!msgstr.is_string())
            throw Error("message catalog entry is not a string: " + msgid);
        catalog.add(msgid, msgstr.get<std::string>());
    }
    return catalog;
}

std::string Catalog::gettext(const std::string& msgid) const
{
    auto it = messages_.find(msgid);
    if (it == messages_.end() || it->second.empty())
        return msgid;
    return it->second;
}

std::optional<std::string> Catalog::gettext_opt(const std::optional<std::string>& msgid) const
{
    if (!msgid)
        return std::nullopt;
    return gettext(*msgid);
}

} // namespace ftmcpp::i18n
