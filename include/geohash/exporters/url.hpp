#ifndef GEOHASH_INCLUDED_EXPORTERS_URL
#define GEOHASH_INCLUDED_EXPORTERS_URL

#include <string>
#include <string_view>

namespace geohash::exporters
{

inline constexpr std::string_view s_hash_path_segment = "/h/";

/// `base` without trailing slashes, then "/h/", then the hash. The hash is
/// not validated.
[[nodiscard]]
inline auto to_url(std::string_view hash, std::string_view base = {}) -> std::string
{
    while (!base.empty() && base.back() == '/')
    {
        base.remove_suffix(1);
    }
    std::string url;
    url.reserve(base.size() + s_hash_path_segment.size() + hash.size());
    url.append(base).append(s_hash_path_segment).append(hash);
    return url;
}

} // namespace geohash::exporters

#endif // GEOHASH_INCLUDED_EXPORTERS_URL
