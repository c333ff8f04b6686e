#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "chunkguard/images/image.hpp"

namespace {

std::vector<std::uint8_t> bytes_of(const std::string &text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

void register_images_tests(chunkguard::tests::TestList &tests) {
  using chunkguard::tests::require;
  namespace im = chunkguard::images;
  namespace cm = chunkguard::common;
  using chunkguard::testing::make_limits;

  tests.push_back({"image_raw_bytes_default_to_png", [] {
                     const auto image = im::normalize_image(im::ImageBytes{bytes_of("fake")});
                     require(image.ok(), "raw bytes should normalize");
                     require(image.value().mime_type == "image/png", "default mime type");
                     require(image.value().size_bytes == 4, "size should equal buffer length");
                   }});

  tests.push_back({"image_base64_and_data_url", [] {
                     const auto plain = im::normalize_image(im::Base64Image{"aGVsbG8="});
                     require(plain.ok() && plain.value().bytes == bytes_of("hello"),
                             "plain base64 should decode");
                     require(plain.value().mime_type == "image/png", "plain base64 mime default");

                     const auto url =
                         im::normalize_image(im::Base64Image{"data:image/jpeg;base64,aGVsbG8="});
                     require(url.ok(), "data url should decode");
                     require(url.value().mime_type == "image/jpeg", "mime should come from url");
                     require(url.value().size_bytes == 5, "payload size mismatch");
                   }});

  tests.push_back({"image_rejects_bad_payloads", [] {
                     const auto garbage = im::normalize_image(im::Base64Image{"***"});
                     require(!garbage.ok(), "garbage base64 should fail");
                     require(garbage.error().code == cm::ErrorCode::InvalidInput,
                             "bad base64 is invalid input");

                     const auto not_image =
                         im::normalize_image(im::Base64Image{"data:text/plain;base64,aGk="});
                     require(!not_image.ok(), "non-image data url should fail");

                     const auto not_base64 =
                         im::normalize_image(im::Base64Image{"data:image/png,raw"});
                     require(!not_base64.ok(), "data url without ;base64 should fail");
                   }});

  tests.push_back({"image_explicit_buffer_keeps_mime", [] {
                     const auto image =
                         im::normalize_image(im::ImageBuffer{bytes_of("gif!"), "image/gif"});
                     require(image.ok() && image.value().mime_type == "image/gif",
                             "explicit mime should be kept");
                     const auto unnamed = im::normalize_image(im::ImageBuffer{bytes_of("x"), ""});
                     require(unnamed.ok() && unnamed.value().mime_type == "image/png",
                             "empty mime falls back to png");
                   }});

  tests.push_back({"image_count_limit", [] {
                     std::vector<im::RawImage> images(20, im::ImageBytes{bytes_of("fake-image-data")});
                     const auto result =
                         im::validate_images(images, make_limits(512'000, 512'000, 128'000, 10, 100));
                     require(!result.ok(), "20 images should exceed 10");
                     require(result.error().code == cm::ErrorCode::ImageLimitExceeded, "wrong code");
                     require(result.error().dimension == cm::LimitDimension::Images,
                             "wrong dimension");
                     require(result.error().actual == 20 && result.error().allowed == 10,
                             "actual/allowed mismatch");
                   }});

  tests.push_back({"image_size_limit_names_index", [] {
                     std::vector<im::RawImage> images = {im::ImageBytes{bytes_of("small")},
                                                         im::ImageBytes{bytes_of("far too large")}};
                     const auto result =
                         im::validate_images(images, make_limits(1000, 1000, 1000, 5, 8));
                     require(!result.ok(), "second image should be too large");
                     require(result.error().dimension == cm::LimitDimension::ImageBytes,
                             "wrong dimension");
                     require(result.error().image_index == std::optional<std::size_t>(1),
                             "offending index should be reported");
                     require(result.error().actual == 13 && result.error().allowed == 8,
                             "actual/allowed mismatch");
                   }});

  tests.push_back({"image_validation_normalizes_in_order", [] {
                     std::vector<im::RawImage> images = {
                         im::ImageBuffer{bytes_of("a"), "image/webp"},
                         im::Base64Image{"data:image/gif;base64,Yg=="},
                     };
                     const auto result =
                         im::validate_images(images, make_limits(1000, 1000, 1000, 2, 10));
                     require(result.ok(), "both images should validate");
                     require(result.value().size() == 2, "two images expected");
                     require(result.value()[0].mime_type == "image/webp", "order preserved");
                     require(result.value()[1].mime_type == "image/gif", "order preserved");
                     require(im::images_byte_size(result.value()) == 2, "total size mismatch");
                   }});

  tests.push_back({"image_empty_list_needs_no_capacity", [] {
                     const auto result = im::validate_images({}, make_limits(10, 10, 10, 0, 0));
                     require(result.ok() && result.value().empty(), "no images is always fine");
                   }});
}
