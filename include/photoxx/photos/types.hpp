/*

types.hpp
---------

Request and response types of the Google Photos Library `mediaItems:search` call.
Field names follow the REST reference in snake_case; the wire names are lowerCamelCase.

*/

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace photoxx::photos
{

inline constexpr std::string_view scope_library_readonly =
    "https://www.googleapis.com/auth/photoslibrary.readonly";

enum class content_category
{
    none,
    landscapes,
    receipts,
    cityscapes,
    landmarks,
    selfies,
    people,
    pets,
    weddings,
    birthdays,
    documents,
    travel,
    animals,
    food,
    sport,
    night,
    performances,
    whiteboards,
    screenshots,
    utility,
    arts,
    crafts,
    fashion,
    houses,
    gardens,
    flowers,
    holidays,
    unknown
};

enum class media_type
{
    all_media,
    video,
    photo,
    unknown
};

enum class feature
{
    none,
    favorites,
    unknown
};

enum class video_processing_status
{
    unspecified,
    processing,
    ready,
    failed,
    unknown
};

namespace detail
{

template<typename Enum>
using wire_names = std::array<std::pair<Enum, std::string_view>, static_cast<std::size_t>(Enum::unknown)>;

inline constexpr wire_names<content_category> content_category_names{{
    {content_category::none, "NONE"},
    {content_category::landscapes, "LANDSCAPES"},
    {content_category::receipts, "RECEIPTS"},
    {content_category::cityscapes, "CITYSCAPES"},
    {content_category::landmarks, "LANDMARKS"},
    {content_category::selfies, "SELFIES"},
    {content_category::people, "PEOPLE"},
    {content_category::pets, "PETS"},
    {content_category::weddings, "WEDDINGS"},
    {content_category::birthdays, "BIRTHDAYS"},
    {content_category::documents, "DOCUMENTS"},
    {content_category::travel, "TRAVEL"},
    {content_category::animals, "ANIMALS"},
    {content_category::food, "FOOD"},
    {content_category::sport, "SPORT"},
    {content_category::night, "NIGHT"},
    {content_category::performances, "PERFORMANCES"},
    {content_category::whiteboards, "WHITEBOARDS"},
    {content_category::screenshots, "SCREENSHOTS"},
    {content_category::utility, "UTILITY"},
    {content_category::arts, "ARTS"},
    {content_category::crafts, "CRAFTS"},
    {content_category::fashion, "FASHION"},
    {content_category::houses, "HOUSES"},
    {content_category::gardens, "GARDENS"},
    {content_category::flowers, "FLOWERS"},
    {content_category::holidays, "HOLIDAYS"},
}};

inline constexpr wire_names<media_type> media_type_names{{
    {media_type::all_media, "ALL_MEDIA"},
    {media_type::video, "VIDEO"},
    {media_type::photo, "PHOTO"},
}};

inline constexpr wire_names<feature> feature_names{{
    {feature::none, "NONE"},
    {feature::favorites, "FAVORITES"},
}};

inline constexpr wire_names<video_processing_status> video_status_names{{
    {video_processing_status::unspecified, "UNSPECIFIED"},
    {video_processing_status::processing, "PROCESSING"},
    {video_processing_status::ready, "READY"},
    {video_processing_status::failed, "FAILED"},
}};

template<typename Enum, std::size_t N>
[[nodiscard]] constexpr std::string_view name_of(const std::array<std::pair<Enum, std::string_view>, N>& names, Enum value) noexcept
{
    for (const auto& [e, name] : names)
    {
        if (e == value)
            return name;
    }
    return {};
}

template<typename Enum, std::size_t N>
[[nodiscard]] constexpr Enum value_of(const std::array<std::pair<Enum, std::string_view>, N>& names, std::string_view name) noexcept
{
    for (const auto& [e, n] : names)
    {
        if (n == name)
            return e;
    }
    return Enum::unknown;
}

} // namespace detail

/// Wire name, empty for `unknown`.
[[nodiscard]] constexpr std::string_view to_string(content_category v) noexcept { return detail::name_of(detail::content_category_names, v); }
[[nodiscard]] constexpr std::string_view to_string(media_type v) noexcept { return detail::name_of(detail::media_type_names, v); }
[[nodiscard]] constexpr std::string_view to_string(feature v) noexcept { return detail::name_of(detail::feature_names, v); }
[[nodiscard]] constexpr std::string_view to_string(video_processing_status v) noexcept { return detail::name_of(detail::video_status_names, v); }

[[nodiscard]] constexpr content_category content_category_from_string(std::string_view s) noexcept { return detail::value_of(detail::content_category_names, s); }
[[nodiscard]] constexpr media_type media_type_from_string(std::string_view s) noexcept { return detail::value_of(detail::media_type_names, s); }
[[nodiscard]] constexpr feature feature_from_string(std::string_view s) noexcept { return detail::value_of(detail::feature_names, s); }
[[nodiscard]] constexpr video_processing_status video_status_from_string(std::string_view s) noexcept { return detail::value_of(detail::video_status_names, s); }

// ---------------------------------------------------------------- request

/// Calendar date; zero fields are wildcards (e.g. year 0 matches every year).
struct date
{
    int year{0};
    int month{0};
    int day{0};
};

struct date_range
{
    std::optional<date> start_date;
    std::optional<date> end_date;
};

struct date_filter
{
    std::vector<date> dates;
    std::vector<date_range> ranges;
};

struct content_filter
{
    std::vector<content_category> included_content_categories;
    std::vector<content_category> excluded_content_categories;
};

struct media_type_filter
{
    std::vector<media_type> media_types;
};

struct feature_filter
{
    std::vector<feature> included_features;
};

struct filters
{
    std::optional<photos::date_filter> date_filter;
    std::optional<photos::content_filter> content_filter;
    std::optional<photos::media_type_filter> media_type_filter;
    std::optional<photos::feature_filter> feature_filter;
    bool include_archived_media{false};
    bool exclude_non_app_created_data{false};
};

/**
Body of `mediaItems:search`. Every unset member is left out of the JSON body.
**/
struct search_request
{
    int page_size{0};
    std::string page_token;
    std::string album_id;
    std::optional<photos::filters> filters;
};

// ---------------------------------------------------------------- response

struct photo
{
    std::string camera_make;
    std::string camera_model;
    double focal_length{0.0};
    double aperture_f_number{0.0};
    double iso_equivalent{0.0};
    std::string exposure_time;
};

struct video
{
    std::string camera_make;
    std::string camera_model;
    double fps{0.0};
    std::optional<video_processing_status> status;
};

struct media_metadata
{
    std::string creation_time;
    std::string width;
    std::string height;
    std::optional<photos::photo> photo;
    std::optional<photos::video> video;
};

struct contributor_info
{
    std::string profile_picture_base_url;
    std::string display_name;
};

struct media_item
{
    std::string id;
    std::string description;
    std::string product_url;
    std::string base_url;
    std::string mime_type;
    std::optional<photos::media_metadata> media_metadata;
    std::optional<photos::contributor_info> contributor_info;
    std::string filename;
};

struct search_response
{
    std::string next_page_token;
    std::vector<media_item> media_items;

    [[nodiscard]] bool has_next_page() const noexcept { return !next_page_token.empty(); }
};

/**
Request for the page following `response`, or an empty optional on the last page.
**/
[[nodiscard]] inline std::optional<search_request> next_page(search_request request, const search_response& response)
{
    if (!response.has_next_page())
        return std::nullopt;
    request.page_token = response.next_page_token;
    return request;
}

} // namespace photoxx::photos
