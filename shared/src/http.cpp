#include "tusclient/http.hpp"

#include <algorithm>
#include <cctype>

namespace tusclient::http
{

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    std::optional<std::string> header_value(const HeaderList &headers, std::string_view name)
    {
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> header_values(const HeaderList &headers, std::string_view name)
    {
        std::vector<std::string> values;
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                values.push_back(value);
            }
        }
        return values;
    }

} // namespace tusclient::http
