#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/regex.hpp>

#include "tpp/util/result.hpp"
#include "tpp/util/strings.hpp"

#include "tpp/path_pattern.hpp"

namespace tpp {

struct Path_Pattern::Impl {
    boost::regex regex;
};

Path_Pattern::Path_Pattern(std::shared_ptr<const Impl> impl, std::u8string_view pattern)
    : m_impl { std::move(impl) }
    , m_pattern { pattern }
{
}

Result<Path_Pattern, Path_Pattern_Error> Path_Pattern::make(std::u8string_view pattern)
{
    constexpr auto flags = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;

    const std::string_view chars = as_string_view(pattern);
    auto impl = std::make_shared<Impl>(boost::regex(chars.begin(), chars.end(), flags));
    if (impl->regex.status() != 0) {
        return Path_Pattern_Error::bad_pattern;
    }
    return Path_Pattern { std::move(impl), pattern };
}

bool Path_Pattern::matches(std::u8string_view path) const
{
    const std::string_view chars = as_string_view(path);
    return boost::regex_match(chars.begin(), chars.end(), m_impl->regex);
}

} // namespace tpp
