/*

json.hpp
--------

nlohmann::json conversions of the photos types. Requests are written with every empty
member omitted and values without a wire name dropped; responses are read leniently,
absent members keep their defaults.

*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <photoxx/detail/json_read.hpp>
#include <photoxx/detail/result.hpp>
#include <photoxx/photos/types.hpp>

namespace photoxx::photos
{

namespace detail
{

template<typename Enum>
inline nlohmann::json enum_array(const std::vector<Enum>& values)
{
    auto out = nlohmann::json::array();
    for (Enum v : values)
    {
        const auto name = to_string(v);
        if (!name.empty())
            out.push_back(std::string(name));
    }
    return out;
}

template<typename Enum>
inline result<void> check_names(const std::vector<Enum>& values, std::string_view what)
{
    for (Enum v : values)
    {
        if (to_string(v).empty())
            return fail<void>(errc::encode_failed, "request holds an unknown " + std::string(what) + " value");
    }
    return ok();
}

using photoxx::detail::read_number;
using photoxx::detail::read_object;
using photoxx::detail::read_text;

} // namespace detail

// ---------------------------------------------------------------- request

/**
`encode_failed` when a filter holds a value without a wire name. to_json leaves such
values out, so run this first on anything about to be sent.
**/
inline result<void> check_encodable(const search_request& r)
{
    if (!r.filters)
        return ok();
    const auto& f = *r.filters;
    if (f.content_filter)
    {
        if (auto res = detail::check_names(f.content_filter->included_content_categories, "content category"); !res)
            return res;
        if (auto res = detail::check_names(f.content_filter->excluded_content_categories, "content category"); !res)
            return res;
    }
    if (f.media_type_filter)
    {
        if (auto res = detail::check_names(f.media_type_filter->media_types, "media type"); !res)
            return res;
    }
    if (f.feature_filter)
    {
        if (auto res = detail::check_names(f.feature_filter->included_features, "feature"); !res)
            return res;
    }
    return ok();
}

inline void to_json(nlohmann::json& j, const date& d)
{
    j = nlohmann::json::object();
    if (d.year != 0)
        j["year"] = d.year;
    if (d.month != 0)
        j["month"] = d.month;
    if (d.day != 0)
        j["day"] = d.day;
}

inline void to_json(nlohmann::json& j, const date_range& r)
{
    j = nlohmann::json::object();
    if (r.start_date)
        j["startDate"] = *r.start_date;
    if (r.end_date)
        j["endDate"] = *r.end_date;
}

inline void to_json(nlohmann::json& j, const date_filter& f)
{
    j = nlohmann::json::object();
    if (!f.dates.empty())
        j["dates"] = f.dates;
    if (!f.ranges.empty())
        j["ranges"] = f.ranges;
}

inline void to_json(nlohmann::json& j, const content_filter& f)
{
    j = nlohmann::json::object();
    if (!f.included_content_categories.empty())
        j["includedContentCategories"] = detail::enum_array(f.included_content_categories);
    if (!f.excluded_content_categories.empty())
        j["excludedContentCategories"] = detail::enum_array(f.excluded_content_categories);
}

inline void to_json(nlohmann::json& j, const media_type_filter& f)
{
    j = nlohmann::json::object();
    if (!f.media_types.empty())
        j["mediaTypes"] = detail::enum_array(f.media_types);
}

inline void to_json(nlohmann::json& j, const feature_filter& f)
{
    j = nlohmann::json::object();
    if (!f.included_features.empty())
        j["includedFeatures"] = detail::enum_array(f.included_features);
}

inline void to_json(nlohmann::json& j, const filters& f)
{
    j = nlohmann::json::object();
    if (f.date_filter)
        j["dateFilter"] = *f.date_filter;
    if (f.content_filter)
        j["contentFilter"] = *f.content_filter;
    if (f.media_type_filter)
        j["mediaTypeFilter"] = *f.media_type_filter;
    if (f.feature_filter)
        j["featureFilter"] = *f.feature_filter;
    if (f.include_archived_media)
        j["includeArchivedMedia"] = true;
    if (f.exclude_non_app_created_data)
        j["excludeNonAppCreatedData"] = true;
}

inline void to_json(nlohmann::json& j, const search_request& r)
{
    j = nlohmann::json::object();
    if (!r.album_id.empty())
        j["albumId"] = r.album_id;
    if (r.page_size != 0)
        j["pageSize"] = r.page_size;
    if (!r.page_token.empty())
        j["pageToken"] = r.page_token;
    if (r.filters)
        j["filters"] = *r.filters;
}

// ---------------------------------------------------------------- response

inline void from_json(const nlohmann::json& j, photo& p)
{
    p.camera_make = detail::read_text(j, "cameraMake");
    p.camera_model = detail::read_text(j, "cameraModel");
    p.focal_length = detail::read_number(j, "focalLength");
    p.aperture_f_number = detail::read_number(j, "apertureFNumber");
    p.iso_equivalent = detail::read_number(j, "isoEquivalent");
    p.exposure_time = detail::read_text(j, "exposureTime");
}

inline void from_json(const nlohmann::json& j, video& v)
{
    v.camera_make = detail::read_text(j, "cameraMake");
    v.camera_model = detail::read_text(j, "cameraModel");
    v.fps = detail::read_number(j, "fps");
    const std::string status = detail::read_text(j, "status");
    if (!status.empty())
        v.status = video_status_from_string(status);
}

inline void from_json(const nlohmann::json& j, media_metadata& m)
{
    m.creation_time = detail::read_text(j, "creationTime");
    m.width = detail::read_text(j, "width");
    m.height = detail::read_text(j, "height");
    detail::read_object(j, "photo", m.photo);
    detail::read_object(j, "video", m.video);
}

inline void from_json(const nlohmann::json& j, contributor_info& c)
{
    c.profile_picture_base_url = detail::read_text(j, "profilePictureBaseUrl");
    c.display_name = detail::read_text(j, "displayName");
}

inline void from_json(const nlohmann::json& j, media_item& m)
{
    m.id = detail::read_text(j, "id");
    m.description = detail::read_text(j, "description");
    m.product_url = detail::read_text(j, "productUrl");
    m.base_url = detail::read_text(j, "baseUrl");
    m.mime_type = detail::read_text(j, "mimeType");
    detail::read_object(j, "mediaMetadata", m.media_metadata);
    detail::read_object(j, "contributorInfo", m.contributor_info);
    m.filename = detail::read_text(j, "filename");
}

inline void from_json(const nlohmann::json& j, search_response& r)
{
    r.next_page_token = detail::read_text(j, "nextPageToken");
    r.media_items.clear();
    auto it = j.find("mediaItems");
    if (it != j.end() && !it->is_null())
        r.media_items = it->get<std::vector<media_item>>();
}

} // namespace photoxx::photos
