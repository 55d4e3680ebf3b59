#include <gtest/gtest.h>

#include "objmap_io.h"
#include "objmap_io_common.h"
#include "objmap_test_util.h"

using objmap::detail::kObjectRecordSize;
using objmap::detail::kVersion5Code;
using objmap::detail::kVersion6Code;
using objmap::detail::kVersion7Code;
using objmap_test::MapFileBuilder;
using objmap_test::TestObject;

namespace {

bool decode(const std::vector<uint8_t>& bytes, objmap::MapHeader& header,
            std::vector<objmap::ObjectRecord>& objects, std::string& err) {
    return objmap::decode_header(bytes.data(), bytes.size(), header, objects, err);
}

}  // namespace

TEST(VersionCodeTest, KnownCodesMapToRevisions) {
    EXPECT_EQ(objmap::detail::version_from_code(880102u), 1);
    EXPECT_EQ(objmap::detail::version_from_code(kVersion5Code), 5);
    EXPECT_EQ(objmap::detail::version_from_code(kVersion6Code), 6);
    EXPECT_EQ(objmap::detail::version_from_code(kVersion7Code), 7);
    EXPECT_EQ(objmap::detail::version_from_code(0u), 0);
    EXPECT_EQ(objmap::detail::version_from_code(20050828u), 0);
}

TEST(HeaderDecodeTest, Version6Header) {
    const auto bytes = MapFileBuilder(kVersion6Code).dims(4, 5, 6).add_objects(2).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    ASSERT_TRUE(decode(bytes, header, objects, err)) << err;

    EXPECT_EQ(header.version_code, kVersion6Code);
    EXPECT_EQ(header.version, 6);
    EXPECT_EQ(header.width, 4u);
    EXPECT_EQ(header.height, 5u);
    EXPECT_EQ(header.depth, 6u);
    EXPECT_EQ(header.object_count, 2u);
    EXPECT_EQ(header.volume_count, 1u);
    EXPECT_FALSE(header.multi_volume());
    EXPECT_EQ(header.pixel_offset, objmap::detail::kBaseHeaderSize + 2 * kObjectRecordSize);
    EXPECT_EQ(objects.size(), 2u);
}

TEST(HeaderDecodeTest, Version7HeaderCarriesVolumeCount) {
    const auto bytes = MapFileBuilder(kVersion7Code).dims(4, 4, 2).volumes(3).add_objects(2).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    ASSERT_TRUE(decode(bytes, header, objects, err)) << err;

    EXPECT_EQ(header.version, 7);
    EXPECT_EQ(header.volume_count, 3u);
    EXPECT_TRUE(header.multi_volume());
    EXPECT_EQ(header.pixel_offset, objmap::detail::kVersion7HeaderSize + 2 * kObjectRecordSize);
}

TEST(HeaderDecodeTest, OlderRevisionUsesPreSevenLayout) {
    const auto bytes = MapFileBuilder(kVersion5Code).dims(2, 2, 2).add_objects(1).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    ASSERT_TRUE(decode(bytes, header, objects, err)) << err;
    EXPECT_EQ(header.version, 5);
    EXPECT_EQ(header.volume_count, 1u);
    EXPECT_EQ(header.pixel_offset, objmap::detail::kBaseHeaderSize + kObjectRecordSize);
}

TEST(HeaderDecodeTest, ObjectRecordFields) {
    TestObject brain;
    brain.name = "Brain";
    brain.color = {12, 34, 56};
    brain.display_flag = 1;
    brain.opacity = 0.25f;
    brain.blend_factor = 0.75f;
    brain.min_bound = {1, 2, 3};
    brain.max_bound = {-4, 500, 6};
    TestObject lesion;
    lesion.name = "Lesion";
    lesion.display_flag = 0;

    const auto bytes = MapFileBuilder().add_object(brain).add_object(lesion).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    ASSERT_TRUE(decode(bytes, header, objects, err)) << err;
    ASSERT_EQ(objects.size(), 2u);

    const objmap::ObjectRecord& a = objects[0];
    EXPECT_EQ(a.name, "Brain");
    EXPECT_EQ(a.label, 1u);
    EXPECT_TRUE(a.visible());
    EXPECT_EQ(a.copy_flag, 1);
    EXPECT_EQ(a.mirror, 2);
    EXPECT_EQ(a.status, 3);
    EXPECT_EQ(a.n_used, 4);
    EXPECT_EQ(a.shades, 32);
    EXPECT_EQ(a.start_color, (objmap::Triple{12, 34, 56}));
    EXPECT_EQ(a.end_color, (objmap::Triple{6, 17, 28}));
    EXPECT_EQ(a.rotation, (objmap::Triple{-1, 0, 1}));
    EXPECT_EQ(a.translation, (objmap::Triple{-2, 0, 2}));
    EXPECT_EQ(a.center, (objmap::Triple{-3, 0, 3}));
    EXPECT_EQ(a.rotation_increment, (objmap::Triple{-4, 0, 4}));
    EXPECT_EQ(a.translation_increment, (objmap::Triple{-5, 0, 5}));
    EXPECT_EQ(a.min_bound, (objmap::ShortTriple{1, 2, 3}));
    EXPECT_EQ(a.max_bound, (objmap::ShortTriple{-4, 500, 6}));
    EXPECT_FLOAT_EQ(a.opacity, 0.25f);
    EXPECT_EQ(a.opacity_thickness, 7);
    EXPECT_FLOAT_EQ(a.blend_factor, 0.75f);

    EXPECT_EQ(objects[1].name, "Lesion");
    EXPECT_EQ(objects[1].label, 2u);
    EXPECT_FALSE(objects[1].visible());
}

TEST(HeaderDecodeTest, NameMayFillThirtyOneBytes) {
    TestObject obj;
    obj.name = std::string(31, 'x');
    const auto bytes = MapFileBuilder().add_object(obj).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    ASSERT_TRUE(decode(bytes, header, objects, err)) << err;
    EXPECT_EQ(objects[0].name, std::string(31, 'x'));
}

TEST(HeaderDecodeTest, UnterminatedNameFails) {
    TestObject obj;
    obj.terminated = false;
    const auto bytes = MapFileBuilder().add_objects(1).add_object(obj).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("object 1"), std::string::npos) << err;
    EXPECT_NE(err.find("NUL"), std::string::npos) << err;
    EXPECT_TRUE(objects.empty());
}

TEST(HeaderDecodeTest, UnrecognisedVersionCodeFails) {
    const auto bytes = MapFileBuilder(12345u).add_objects(1).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("unrecognised version code 12345"), std::string::npos) << err;
}

TEST(HeaderDecodeTest, TruncatedHeaderFails) {
    auto bytes = MapFileBuilder(kVersion7Code).volumes(2).build({});
    bytes.resize(22);
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("truncated header"), std::string::npos) << err;

    std::vector<uint8_t> tiny{0x00, 0x0d};
    EXPECT_FALSE(decode(tiny, header, objects, err));
}

TEST(HeaderDecodeTest, ObjectTableTruncatedFails) {
    const auto bytes = MapFileBuilder().add_objects(2).declared_objects(3).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("object table truncated"), std::string::npos) << err;
}

TEST(HeaderDecodeTest, HugeObjectCountFailsBeforeAllocating) {
    const auto bytes = MapFileBuilder().declared_objects(0xFFFFFFFFu).build(std::vector<uint8_t>(64, 0));
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_TRUE(objects.empty());
}

TEST(HeaderDecodeTest, ZeroVolumeCountFails) {
    const auto bytes = MapFileBuilder(kVersion7Code).volumes(0).add_objects(1).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("volume count is zero"), std::string::npos) << err;
}

TEST(HeaderDecodeTest, ZeroDimensionFails) {
    const auto bytes = MapFileBuilder().dims(4, 0, 2).add_objects(1).build({});
    objmap::MapHeader header;
    std::vector<objmap::ObjectRecord> objects;
    std::string err;
    EXPECT_FALSE(decode(bytes, header, objects, err));
    EXPECT_NE(err.find("invalid dimensions"), std::string::npos) << err;
}
