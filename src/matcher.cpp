#include <ultracode/matcher.hpp>
#include <ultracode/symbologies/ean13.hpp>
#include <ultracode/symbologies/code128.hpp>

#include <array>

namespace ultracode {

namespace {

constexpr std::array<matcher_entry, 2> BUILTIN_MATCHERS = {{
    {ean13_matcher::name,   ean13_matcher::formats,   &ean13_matcher::match},
    {code128_matcher::name, code128_matcher::formats, &code128_matcher::match},
}};

} // namespace

std::span<const matcher_entry> builtin_matchers() noexcept {
    return BUILTIN_MATCHERS;
}

const matcher_entry* find_matcher(std::string_view name) noexcept {
    for (const auto& entry : BUILTIN_MATCHERS) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace ultracode
