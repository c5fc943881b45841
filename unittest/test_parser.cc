//
// Handler dispatch and the convenience scan helpers
//

#include <doctest/doctest.h>
#include <oskar/parser.hh>
#include <oskar/exceptions.hh>
#include <sstream>
#include <string>
#include <vector>
#include "test_utils.hh"

using namespace oskar;

namespace {
    bytes_t keyed_record(std::uint8_t group, std::uint8_t tag_id, std::uint32_t index, const std::string& text) {
        tag_fields f;
        f.chunk_flags = chunk_flag::crc32c;
        f.group_id = group;
        f.tag_id = tag_id;
        f.user_index = index;
        return make_record(f, bytes_of(text));
    }

    // Station layout in group 1, telescope name in group 2
    bytes_t sample_file() {
        bytes_t file = make_header();
        append(file, keyed_record(1, 1, 0, "x"));
        append(file, keyed_record(1, 2, 1, "y"));
        append(file, keyed_record(2, 1, 0, "LOFAR"));
        append(file, keyed_record(1, 1, 2, "z"));
        return file;
    }

    record make_keyed(std::uint8_t group, std::uint8_t tag_id) {
        record rec;
        rec.tag.group_id = group;
        rec.tag.tag_id = tag_id;
        return rec;
    }
}

TEST_CASE("handler registry - precedence") {
    handler_registry registry;
    std::vector<std::string> calls;

    registry.on_any([&](const record&) { calls.push_back("any"); });
    registry.on_group(1, [&](const record&) { calls.push_back("group"); });
    registry.on_record(1, 2, [&](const record&) { calls.push_back("tag"); });
    registry.on_record(1, 2, [&](const record&) { calls.push_back("tag again"); });

    SUBCASE("tag specific first") {
        CHECK(registry.emit(make_keyed(1, 2)) == 4);
        CHECK(calls == std::vector<std::string>{"tag", "tag again", "group", "any"});
    }

    SUBCASE("group without tag match") {
        CHECK(registry.emit(make_keyed(1, 3)) == 2);
        CHECK(calls == std::vector<std::string>{"group", "any"});
    }

    SUBCASE("tag id alone does not match") {
        CHECK(registry.emit(make_keyed(2, 2)) == 1);
        CHECK(calls == std::vector<std::string>{"any"});
    }
}

TEST_CASE("handler registry - empty") {
    handler_registry registry;
    CHECK(registry.empty());
    CHECK(registry.emit(make_keyed(1, 1)) == 0);

    registry.on_group(9, [](const record&) {});
    CHECK_FALSE(registry.empty());
}

TEST_CASE("parse - routes every record") {
    auto file = sample_file();
    std::istringstream stream(as_string(file));

    handler_registry registry;
    std::vector<std::uint32_t> station_indices;
    std::string telescope;
    int total = 0;

    registry.on_record(1, 1, [&](const record& rec) { station_indices.push_back(rec.tag.user_index); });
    registry.on_group(2, [&](const record& rec) { telescope = *rec.get_if<std::string>(); });
    registry.on_any([&](const record&) { ++total; });

    auto header = parse(stream, registry);

    CHECK(header.version == 2);
    CHECK(station_indices == std::vector<std::uint32_t>{0, 2});
    CHECK(telescope == "LOFAR");
    CHECK(total == 4);
}

TEST_CASE("parse - errors reach the caller") {
    auto file = sample_file();
    file.back() ^= std::byte{0x10};
    std::istringstream stream(as_string(file));

    handler_registry registry;
    int seen = 0;
    registry.on_any([&](const record&) { ++seen; });

    CHECK_THROWS_AS(parse(stream, registry), checksum_mismatch_error);
    CHECK(seen == 3);
}

TEST_CASE("for_each_record") {
    auto file = sample_file();

    SUBCASE("stream") {
        std::istringstream stream(as_string(file));
        std::vector<std::uint64_t> offsets;
        for_each_record(stream, [&](const record& rec) { offsets.push_back(rec.file_offset); });
        CHECK(offsets == std::vector<std::uint64_t>{64, 89, 114, 143});
    }

    SUBCASE("iterator") {
        auto it = record_iterator::open(file.data(), file.size());
        it->next();
        int remaining = 0;
        for_each_record(*it, [&](const record&) { ++remaining; });
        CHECK(remaining == 3);
        CHECK(it->at_end());
    }

    SUBCASE("path") {
        auto path = write_temp_file("for_each.oskar", file);
        std::string names;
        for_each_record(path, [&](const record& rec) { names += *rec.get_if<std::string>(); });
        CHECK(names == "xyLOFARz");
        std::filesystem::remove(path);
    }
}

TEST_CASE("read_all") {
    auto file = sample_file();

    SUBCASE("stream") {
        std::istringstream stream(as_string(file));
        auto result = read_all(stream);
        const auto& records = result.second;
        CHECK(result.first.app_version == 0x00020001);
        REQUIRE(records.size() == 4);
        CHECK(std::get<std::string>(records[2].value) == "LOFAR");
        CHECK(records[3].tag.user_index == 2);
    }

    SUBCASE("path") {
        auto path = write_temp_file("read_all.oskar", file);
        auto result = read_all(path);
        const auto& records = result.second;
        CHECK(result.first.version == 2);
        REQUIRE(records.size() == 4);
        CHECK(std::get<std::string>(records[0].value) == "x");
        std::filesystem::remove(path);
    }

    SUBCASE("stream without positioning") {
        forward_only_buf buf(file);
        std::istream stream(&buf);
        auto result = read_all(stream);
        REQUIRE(result.second.size() == 4);
        CHECK(result.second[3].file_offset == 143);
    }

    SUBCASE("lenient options are passed through") {
        file.back() ^= std::byte{0x10};
        std::istringstream stream(as_string(file));

        scan_options options;
        options.strict = false;
        auto records = read_all(stream, options).second;
        REQUIRE(records.size() == 4);
        CHECK_FALSE(records[3].checksum_ok);
    }
}
