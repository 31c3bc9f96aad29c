/*

test_photos_json.cpp
--------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE photos_json_test

#include <boost/test/unit_test.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include <photoxx/photos/json.hpp>
#include <photoxx/photos/types.hpp>

namespace photos = photoxx::photos;
using nlohmann::json;


BOOST_AUTO_TEST_CASE(empty_request_is_empty_object)
{
    const json j = photos::search_request{};
    BOOST_TEST(j.dump() == "{}");
}

BOOST_AUTO_TEST_CASE(pets_request_omits_unset_members)
{
    photos::search_request req;
    req.page_size = 100;
    req.filters.emplace().content_filter.emplace().included_content_categories.push_back(
        photos::content_category::pets);

    const json j = req;
    const json expected = json::parse(R"({
        "pageSize": 100,
        "filters": {"contentFilter": {"includedContentCategories": ["PETS"]}}
    })");
    BOOST_TEST(j == expected);
}

BOOST_AUTO_TEST_CASE(full_filter_tree)
{
    photos::search_request req;
    req.page_token = "tok";
    photos::filters f;
    photos::date_filter dates;
    dates.dates.push_back({2020, 0, 0});
    dates.ranges.push_back({photos::date{2019, 1, 1}, std::nullopt});
    f.date_filter = dates;
    f.media_type_filter = photos::media_type_filter{{photos::media_type::photo}};
    f.feature_filter = photos::feature_filter{{photos::feature::favorites}};
    f.include_archived_media = true;
    req.filters = f;

    const json j = req;
    const json expected = json::parse(R"({
        "pageToken": "tok",
        "filters": {
            "dateFilter": {
                "dates": [{"year": 2020}],
                "ranges": [{"startDate": {"year": 2019, "month": 1, "day": 1}}]
            },
            "mediaTypeFilter": {"mediaTypes": ["PHOTO"]},
            "featureFilter": {"includedFeatures": ["FAVORITES"]},
            "includeArchivedMedia": true
        }
    })");
    BOOST_TEST(j == expected);
}

BOOST_AUTO_TEST_CASE(unknown_enum_is_not_encodable)
{
    photos::search_request req;
    auto& content = req.filters.emplace().content_filter.emplace();
    content.included_content_categories.push_back(photos::content_category::pets);
    content.excluded_content_categories.push_back(photos::content_category::unknown);

    auto res = photos::check_encodable(req);
    BOOST_REQUIRE(!res.has_value());
    BOOST_TEST(res.error().code == photoxx::errc::encode_failed);
    BOOST_TEST(res.error().message.find("content category") != std::string::npos);

    content.excluded_content_categories.clear();
    BOOST_TEST(photos::check_encodable(req).has_value());

    req.filters->feature_filter.emplace().included_features.push_back(photos::feature::unknown);
    BOOST_TEST(!photos::check_encodable(req).has_value());
}

BOOST_AUTO_TEST_CASE(unknown_enum_is_left_out_of_json)
{
    photos::media_type_filter f;
    f.media_types = {photos::media_type::unknown, photos::media_type::video};

    const json j = f;
    BOOST_TEST(j == json::parse(R"({"mediaTypes":["VIDEO"]})"));
}

BOOST_AUTO_TEST_CASE(enum_wire_names)
{
    BOOST_TEST(photos::to_string(photos::content_category::holidays) == "HOLIDAYS");
    BOOST_TEST(photos::to_string(photos::media_type::all_media) == "ALL_MEDIA");
    BOOST_TEST(photos::to_string(photos::video_processing_status::ready) == "READY");
    BOOST_TEST(photos::to_string(photos::content_category::unknown).empty());
    BOOST_TEST(photos::to_string(photos::content_category_from_string("SELFIES")) == "SELFIES");
    BOOST_TEST(photos::to_string(photos::content_category_from_string("DOGS")).empty());
}

BOOST_AUTO_TEST_CASE(response_decodes_with_defaults)
{
    const auto j = json::parse(R"({
        "mediaItems": [
            {
                "id": "m1",
                "productUrl": "https://photos.google.com/lr/photo/m1",
                "mimeType": "image/jpeg",
                "filename": "cat.jpg",
                "mediaMetadata": {
                    "creationTime": "2019-05-01T10:00:00Z",
                    "width": "4032",
                    "height": 3024,
                    "photo": {"cameraMake": "Google", "focalLength": 4.44, "isoEquivalent": 100}
                },
                "contributorInfo": {"displayName": "Ann"}
            },
            {
                "id": "m2",
                "mediaMetadata": {"video": {"fps": 29.97, "status": "SOMETHING_NEW"}}
            }
        ],
        "nextPageToken": "next"
    })");

    const auto resp = j.get<photos::search_response>();
    BOOST_TEST(resp.next_page_token == "next");
    BOOST_TEST(resp.has_next_page());
    BOOST_TEST(resp.media_items.size() == 2);

    const auto& first = resp.media_items[0];
    BOOST_TEST(first.id == "m1");
    BOOST_TEST(first.description.empty());
    BOOST_TEST(first.base_url.empty());
    BOOST_TEST(first.filename == "cat.jpg");
    BOOST_TEST(first.media_metadata.has_value());
    BOOST_TEST(first.media_metadata->width == "4032");
    BOOST_TEST(first.media_metadata->height == "3024");
    BOOST_TEST(first.media_metadata->photo.has_value());
    BOOST_TEST(first.media_metadata->photo->camera_make == "Google");
    BOOST_TEST(first.media_metadata->photo->focal_length == 4.44);
    BOOST_TEST(first.media_metadata->photo->iso_equivalent == 100.0);
    BOOST_TEST(first.media_metadata->photo->exposure_time.empty());
    BOOST_TEST(!first.media_metadata->video.has_value());
    BOOST_TEST(first.contributor_info->display_name == "Ann");

    const auto& second = resp.media_items[1];
    BOOST_TEST(second.id == "m2");
    BOOST_TEST(!second.contributor_info.has_value());
    BOOST_TEST(second.media_metadata->video.has_value());
    BOOST_TEST(second.media_metadata->video->fps == 29.97);
    BOOST_TEST(second.media_metadata->video->status.has_value());
    BOOST_TEST(photos::to_string(*second.media_metadata->video->status).empty());
}

BOOST_AUTO_TEST_CASE(last_page_has_no_token)
{
    const auto resp = json::parse("{}").get<photos::search_response>();
    BOOST_TEST(resp.media_items.empty());
    BOOST_TEST(!resp.has_next_page());
    BOOST_TEST(!photos::next_page(photos::search_request{}, resp).has_value());
}

BOOST_AUTO_TEST_CASE(next_page_copies_token)
{
    photos::search_request req;
    req.page_size = 25;
    photos::search_response resp;
    resp.next_page_token = "p2";

    auto next = photos::next_page(req, resp);
    BOOST_TEST(next.has_value());
    BOOST_TEST(next->page_token == "p2");
    BOOST_TEST(next->page_size == 25);
    BOOST_TEST(req.page_token.empty());
}
