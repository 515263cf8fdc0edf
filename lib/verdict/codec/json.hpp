#pragma once
/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <limits>
#include <boost/json.hpp>
#include <verdict/common/bytes.hpp>
#include "serializable.hpp"

namespace verdict::codec::json {
    using namespace boost::json;

    template<typename T>
    concept json_optional_c = requires(T t)
    {
        { t.reset() };
        { t.emplace() };
    };

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    struct decoder: archive_t {
        explicit decoder(const boost::json::value &jv)
        {
            _vals.emplace_back(jv);
        }

        template<typename T>
        static void decode(const boost::json::value &jv, T &val)
        {
            if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (enum_c<T>) {
                val = enum_from_name<T>(boost::json::value_to<std::string_view>(jv));
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, int64_t>
                    || std::is_same_v<T, bool>) {
                val = boost::json::value_to<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = boost::json::value_to<std::string_view>(jv);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process(auto &val)
        {
            decode(_top(), val);
        }

        void process(const std::string_view name, auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            const auto &jo = _top().as_object();
            if (const auto it = jo.find(name); it != jo.end()) {
                decode(it->value(), val);
            } else {
                if constexpr (json_optional_c<T>) {
                    val.reset();
                } else {
                    throw error(fmt::format("a required field '{}' is missing: {}", name, serialize_pretty(jo)));
                }
            }
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto &j_arr = _top().as_array();
            if (!(static_cast<int>(j_arr.size() >= min_sz) & static_cast<int>(j_arr.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", j_arr.size(), min_sz, max_sz));
            self.clear();
            self.reserve(j_arr.size());
            for (size_t i = 0; i < j_arr.size(); ++i) {
                typename T::value_type v;
                decode(j_arr[i], v);
                if constexpr (has_emplace_c<T>) {
                    if (!self.emplace(std::move(v)).second) [[unlikely]]
                        throw error(fmt::format("a set contains non-unique items: {}", serialize_pretty(j_arr)));
                } else {
                    self.emplace_back(std::move(v));
                }
            }
        }

        template<typename T>
        void process_optional(T &val)
        {
            val.reset();
            if (!_top().is_null()) {
                val.emplace();
                decode(_top(), *val);
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            const auto &jv = _top();
            if (jv.is_string()) {
                const auto hex = _hex_data(boost::json::value_to<std::string_view>(jv));
                if (hex.size() / 2 > max_sz) [[unlikely]]
                    throw error(fmt::format("a byte string of {} bytes exceeds the limit of {} bytes", hex.size() / 2, max_sz));
                bytes.resize(hex.size() / 2);
                init_from_hex(bytes, hex);
            } else if (jv.is_array()) {
                const auto &ja = jv.as_array();
                if (ja.size() > max_sz) [[unlikely]]
                    throw error(fmt::format("a byte string of {} bytes exceeds the limit of {} bytes", ja.size(), max_sz));
                bytes.clear();
                bytes.reserve(ja.size());
                for (const auto &byte: ja) {
                    bytes.emplace_back(boost::json::value_to<uint8_t>(byte));
                }
            } else {
                throw error(fmt::format("expected a bytestring got: {}", serialize_pretty(jv)));
            }
        }

        void process_bytes_fixed(std::span<uint8_t> bytes)
        {
            const auto hex = _hex_data(boost::json::value_to<std::string_view>(_top()));
            if (hex.size() != bytes.size() * 2) [[unlikely]]
                throw error(fmt::format("expected a hex string of {} bytes but got: {}", bytes.size(), hex));
            init_from_hex(bytes, hex);
        }
    private:
        std::vector<std::reference_wrapper<const boost::json::value>> _vals {};

        static std::string_view _hex_data(const std::string_view hex)
        {
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a hex string but got: {}", hex));
            return hex.substr(2);
        }

        const boost::json::value &_top() const
        {
            return _vals.back().get();
        }
    };

    // Builds a JSON document in the same layout that decoder accepts
    struct encoder: archive_t {
        template<typename T>
        static value encode(const T &val)
        {
            if constexpr (serializable_c<T>) {
                encoder enc {};
                const_cast<T &>(val).serialize(enc);
                return std::move(enc._val);
            } else if constexpr (enum_c<T>) {
                return value_from(std::string { enum_name(val) });
            } else if constexpr (std::is_same_v<T, bool>
                    || std::is_same_v<T, int64_t>
                    || std::is_unsigned_v<T>) {
                return value_from(val);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return value_from(val);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process(const std::string_view name, const auto &val)
        {
            if (!_val.is_object())
                _val = object {};
            _val.as_object().insert_or_assign(name, encode(val));
        }

        void process_array(const auto &self, const size_t /*min_sz*/=0, const size_t /*max_sz*/=0)
        {
            array arr {};
            arr.reserve(self.size());
            for (const auto &v: self)
                arr.emplace_back(encode(v));
            _val = std::move(arr);
        }

        void process_optional(const auto &val)
        {
            if (val.has_value())
                _val = encode(*val);
            else
                _val = nullptr;
        }

        void process_bytes(const buffer bytes, const size_t /*max_sz*/=0)
        {
            _val = value_from(fmt::format("{}", bytes));
        }

        void process_bytes_fixed(const buffer bytes)
        {
            process_bytes(bytes);
        }
    private:
        value _val {};
    };

    template<typename T>
    T from_json(const value &jv)
    {
        decoder j_dec { jv };
        T res;
        j_dec.process(res);
        return res;
    }

    template<typename T>
    value to_json(const T &val)
    {
        return encoder::encode(val);
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return from_json<T>(load(path));
    }
}
