/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <boost/container/flat_set.hpp>
#include <verdict/common/test.hpp>
#include "binary.hpp"

namespace {
    using namespace verdict;
    using namespace verdict::codec;

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

    struct item_t {
        uint32_t id = 0;
        color_t color = color_t::red;
        bool flag = false;
        int64_t ts = 0;
        blob_t blob {};
        ids_t ids {};
        maybe_t extra {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("id"sv, id);
            archive.process("color"sv, color);
            archive.process("flag"sv, flag);
            archive.process("ts"sv, ts);
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

suite verdict_codec_binary_suite = [] {
    "verdict::codec::binary"_test = [] {
        "uint_varlen"_test = [] {
            using test_vector = std::pair<uint64_t, std::string_view>;
            static std::vector test_vectors {
                test_vector { 0, "00" },
                test_vector { 127, "7f" },
                test_vector { 128, "8080" },
                test_vector { 16383, "bfff" },
                test_vector { 16384, "c00040" },
                test_vector { uint64_t { 1 } << 56, "ff0000000000000001" }
            };
            for (const auto &[val, exp_hex]: test_vectors) {
                binary::encoder enc {};
                enc.uint_varlen(val);
                expect_equal(uint8_vector::from_hex(exp_hex), enc.bytes());
                binary::decoder dec { enc.bytes() };
                expect_equal(val, dec.uint_varlen());
                expect(dec.empty());
            }
        };
        "uint_fixed"_test = [] {
            expect_equal(uint8_vector::from_hex("2a00000000000000"), binary::encode(uint64_t { 42 }));
            expect_equal(uint8_vector::from_hex("0201"), binary::encode(uint16_t { 0x0102 }));
            binary::encoder enc {};
            expect(throws([&] { enc.uint_fixed(1, 256); }));
        };
        "struct layout"_test = [] {
            item_t item {};
            item.id = 7;
            item.color = color_t::green;
            item.flag = true;
            item.ts = -1;
            item.blob = blob_t { 0xAA, 0xBB };
            item.ids.emplace(3);
            item.ids.emplace(1);
            item.extra.emplace(5);
            const auto bytes = binary::encode(item);
            expect_equal(uint8_vector::from_hex("07000000" "01" "01" "ffffffffffffffff" "02aabb" "0201000300" "0105000000"), bytes);
            expect_equal(item, binary::decode<item_t>(bytes));
        };
        "malformed input"_test = [] {
            const auto valid = binary::encode(item_t {});
            auto trailing = valid;
            trailing.emplace_back(0);
            expect(throws([&] { binary::decode<item_t>(trailing); }));
            const buffer truncated = static_cast<buffer>(valid).subbuf(0, valid.size() - 1);
            expect(throws([&] { binary::decode<item_t>(truncated); }));
            // color out of range
            auto bad_enum = valid;
            bad_enum[4] = 2;
            expect(throws([&] { binary::decode<item_t>(bad_enum); }));
            // a boolean must be 0 or 1
            auto bad_bool = valid;
            bad_bool[5] = 2;
            expect(throws([&] { binary::decode<item_t>(bad_bool); }));
            // a set must not repeat items
            expect(throws([] { binary::decode<ids_t>(uint8_vector::from_hex("0201000100")); }));
            // an oversized byte string
            expect(throws([] { binary::decode<blob_t>(uint8_vector::from_hex("050102030405")); }));
        };
        "limits on encode"_test = [] {
            item_t item {};
            item.blob = blob_t { 1, 2, 3, 4, 5 };
            expect(throws([&] { binary::encode(item); }));
            item.blob.clear();
            for (uint16_t i = 0; i < 4; ++i)
                item.ids.emplace(i);
            expect(throws([&] { binary::encode(item); }));
        };
    };
};
