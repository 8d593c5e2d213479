#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "Errors.hh"
#include "Fixtures.hh"
#include "PatchProvider.hh"
#include "WadFile.hh"

using namespace std;
using namespace WadGfx;

static shared_ptr<const WadFile> provider_test_wad() {
  auto wad = make_shared<WadFile>();
  wad->add("DOOR2_1", encode_test_sprite(2, 4, 0, 0, {TestColumn{TestPost{0, {1, 2, 3, 4}}}, TestColumn{}}));
  wad->add("BROKEN", string("\x01\x00", 2));
  wad->add("SW1BRN1", encode_test_sprite(3, 1, 0, 0, {TestColumn{}, TestColumn{}, TestColumn{}}));
  return wad;
}

static vector<string> provider_test_pnames() {
  return {padded_name("door2_1"), padded_name("BROKEN"), padded_name("NOSUCH"), padded_name("SW1BRN1")};
}

TEST(PatchProviderTest, Lazy) {
  LazyPatchProvider provider(provider_test_wad(), provider_test_pnames());

  auto door = provider.get_patch(0);
  ASSERT_TRUE(door.has_value());
  EXPECT_EQ(2, door->width());
  EXPECT_EQ(4, door->height());
  EXPECT_EQ("DOOR2_1", provider.name_for_patch(0));

  auto switch_patch = provider.get_patch(3);
  ASSERT_TRUE(switch_patch.has_value());
  EXPECT_EQ(3, switch_patch->width());

  EXPECT_FALSE(provider.get_patch(2).has_value());
  EXPECT_FALSE(provider.get_patch(4).has_value());
  EXPECT_EQ("", provider.name_for_patch(4));

  // Decoding happens at lookup time, so decoding errors surface here
  EXPECT_THROW(provider.get_patch(1), malformed_asset);
}

TEST(PatchProviderTest, Eager) {
  EagerPatchProvider provider(provider_test_wad(), provider_test_pnames());
  EXPECT_EQ(2, provider.num_resolved());

  auto door = provider.get_patch(0);
  ASSERT_TRUE(door.has_value());
  EXPECT_EQ(2, door->width());
  EXPECT_EQ(1, door->column(0).num_posts());
  EXPECT_EQ("DOOR2_1", provider.name_for_patch(0));

  EXPECT_TRUE(provider.get_patch(3).has_value());

  // Missing patches are absent; the decoding error is reported on lookup
  EXPECT_THROW(provider.get_patch(1), malformed_asset);
  EXPECT_FALSE(provider.get_patch(2).has_value());
  EXPECT_FALSE(provider.get_patch(4).has_value());
  EXPECT_EQ("BROKEN", provider.name_for_patch(1));
  EXPECT_EQ("", provider.name_for_patch(4));
}

TEST(PatchProviderTest, ProviderKeepsWadAlive) {
  unique_ptr<PatchProvider> provider;
  {
    auto wad = provider_test_wad();
    provider = make_unique<EagerPatchProvider>(wad, provider_test_pnames());
  }
  auto door = provider->get_patch(0);
  ASSERT_TRUE(door.has_value());
  size_t total = 0;
  for (const auto& span : door->column(0)) {
    for (size_t y = 0; y < span.count; y++) {
      total += span.pixels[y];
    }
  }
  EXPECT_EQ(10, total);
}

TEST(PatchProviderTest, LazyAndEagerAgree) {
  auto wad = provider_test_wad();
  auto pnames = provider_test_pnames();
  LazyPatchProvider lazy(wad, pnames);
  EagerPatchProvider eager(wad, pnames);

  for (uint16_t patch_id = 0; patch_id <= pnames.size(); patch_id++) {
    EXPECT_EQ(lazy.name_for_patch(patch_id), eager.name_for_patch(patch_id));
    if (patch_id == 1) {
      EXPECT_THROW(lazy.get_patch(patch_id), malformed_asset);
      EXPECT_THROW(eager.get_patch(patch_id), malformed_asset);
      continue;
    }
    auto lazy_patch = lazy.get_patch(patch_id);
    auto eager_patch = eager.get_patch(patch_id);
    ASSERT_EQ(lazy_patch.has_value(), eager_patch.has_value()) << "patch " << patch_id;
    if (lazy_patch.has_value()) {
      EXPECT_EQ(lazy_patch->dimensions(), eager_patch->dimensions());
      EXPECT_EQ(lazy_patch->size(), eager_patch->size());
    }
  }
}
