#include <ferry/crypto/checksum.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace {

ferry::schema::bytes_view_t view(std::string_view text) {
  return ferry::schema::make_bytes_view(text);
}

}  // namespace

TEST(checksum, md5_known_vectors) {
  EXPECT_EQ(ferry::crypto::md5_hex(view("")),
            "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(ferry::crypto::md5_hex(view("abc")),
            "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(ferry::crypto::md5_hex(
                view("The quick brown fox jumps over the lazy dog")),
            "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(checksum, incremental_updates_match_one_shot) {
  auto hasher = ferry::crypto::md5{};
  hasher.update(view("The quick brown "));
  hasher.update(view(""));
  hasher.update(view("fox jumps over the lazy dog"));
  EXPECT_EQ(hasher.finalize_hex(), "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(checksum, raw_digest_is_sixteen_bytes) {
  auto hasher = ferry::crypto::md5{};
  hasher.update(view("abc"));
  auto digest = hasher.finalize();
  ASSERT_EQ(digest.size(), 16u);
  EXPECT_EQ(digest[0], 0x90);
  EXPECT_EQ(digest[15], 0x72);
}

TEST(checksum, multipart_etag_hashes_part_digests) {
  auto first = ferry::crypto::md5{};
  first.update(view("abc"));
  auto second = ferry::crypto::md5{};
  second.update(view(""));
  auto parts = std::vector<ferry::schema::bytes_t>{first.finalize(),
                                                   second.finalize()};

  auto joined = ferry::schema::bytes_t{};
  joined.insert(std::end(joined), std::begin(parts[0]), std::end(parts[0]));
  joined.insert(std::end(joined), std::begin(parts[1]), std::end(parts[1]));
  auto expected =
      ferry::crypto::md5_hex(ferry::schema::make_bytes_view(joined)) + "-2";

  EXPECT_EQ(ferry::crypto::multipart_etag(parts), expected);
}
