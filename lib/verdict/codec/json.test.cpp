/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <boost/container/flat_set.hpp>
#include <verdict/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::codec::json;

    enum class color_t: uint8_t {
        red,
        green
    };

    struct blob_t: uint8_vector {
        using uint8_vector::uint8_vector;

        void serialize(auto &archive)
        {
            archive.process_bytes(*this, 4);
        }
    };

    struct tag_t: byte_array<4> {
        using byte_array<4>::byte_array;

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(*this);
        }
    };

    struct ids_t: boost::container::flat_set<uint16_t> {
        using base_type = boost::container::flat_set<uint16_t>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_array(*this, 0, 3);
        }
    };

    struct maybe_t: std::optional<uint32_t> {
        using base_type = std::optional<uint32_t>;
        using base_type::base_type;

        void serialize(auto &archive)
        {
            archive.process_optional(*this);
        }
    };

    value parse_text(const std::string_view text)
    {
        return parse(buffer { text });
    }

    struct item_t {
        uint32_t id = 0;
        color_t color = color_t::red;
        bool flag = false;
        tag_t key {};
        blob_t blob {};
        ids_t ids {};
        maybe_t extra {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("id"sv, id);
            archive.process("color"sv, color);
            archive.process("flag"sv, flag);
            archive.process("key"sv, key);
            archive.process("blob"sv, blob);
            archive.process("ids"sv, ids);
            archive.process("extra"sv, extra);
        }

        bool operator==(const item_t &) const = default;
    };
}

namespace verdict::codec {
    template<>
    struct enum_traits<color_t> {
        static constexpr std::array<std::string_view, 2> names { "red", "green" };
    };
}

suite verdict_codec_json_suite = [] {
    "verdict::codec::json"_test = [] {
        "save_pretty + reload object"_test = [] {
            file::tmp t { "verdict-json-save-pretty-object-test.json" };
            const auto j = object {
                { "case_id", 42 },
                { "status", "open" }
            };
            save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect_equal(std::string_view { "{\n  \"case_id\": 42,\n  \"status\": \"open\"\n}" }, static_cast<std::string_view>(static_cast<buffer>(buf)));
            expect(j == load(t.path()));
        };
        "save_pretty + reload array"_test = [] {
            file::tmp t { "verdict-json-save-pretty-array-test.json" };
            const auto j = array { "juror", 3 };
            save_pretty(t.path(), j);
            expect(j == load(t.path()));
        };
        "parse errors"_test = [] {
            expect(throws([] { parse_text("{\"a\": "); }));
            expect(throws([] { load("/nonexistent/verdict-json-test.json"); }));
        };
        "decode"_test = [] {
            const auto j = parse_text(R"({"id": 9, "color": "green", "flag": true, "key": "0x01020304", "blob": [1, 2], "ids": [2, 1]})");
            const auto item = from_json<item_t>(j);
            expect_equal(uint32_t { 9 }, item.id);
            expect(item.color == color_t::green);
            expect(item.flag);
            expect_equal(tag_t::from_hex<tag_t>("01020304"), item.key);
            expect_equal(uint8_vector::from_hex("0102"), static_cast<const uint8_vector &>(item.blob));
            expect_equal(size_t { 2 }, item.ids.size());
            expect(!item.extra.has_value());
        };
        "decode failures"_test = [] {
            // a missing required field
            expect(throws([] { from_json<item_t>(parse_text(R"({"id": 9})")); }));
            // an unknown enum name
            expect(throws([] { from_json<item_t>(parse_text(R"({"id": 9, "color": "blue", "flag": true, "key": "0x01020304", "blob": "0x", "ids": []})")); }));
            // a fixed-size value of a wrong length
            expect(throws([] { from_json<tag_t>(parse_text(R"("0x010203")")); }));
            // hex strings must be 0x-prefixed
            expect(throws([] { from_json<tag_t>(parse_text(R"("01020304")")); }));
            expect(throws([] { from_json<blob_t>(parse_text(R"("0x0102030405")")); }));
            expect(throws([] { from_json<ids_t>(parse_text("[1, 1]")); }));
            expect(throws([] { from_json<ids_t>(parse_text("[1, 2, 3, 4]")); }));
        };
        "encode"_test = [] {
            item_t item {};
            item.id = 3;
            item.key = tag_t::from_hex<tag_t>("0a0b0c0d");
            item.blob = blob_t { 0xFF };
            item.ids.emplace(5);
            item.extra.emplace(11);
            const auto j = to_json(item);
            expect_equal(std::string { "0x0a0b0c0d" }, value_to<std::string>(j.at("key")));
            expect_equal(std::string { "red" }, value_to<std::string>(j.at("color")));
            expect_equal(std::string { "0xff" }, value_to<std::string>(j.at("blob")));
            expect_equal(uint64_t { 11 }, value_to<uint64_t>(j.at("extra")));
            expect_equal(item, from_json<item_t>(j));
        };
    };
};
