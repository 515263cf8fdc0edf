/* Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <sstream>
#include <verdict/common/file.hpp>
#include "json.hpp"

namespace verdict::codec::json {
    value parse(const buffer &buf)
    {
        try {
            return boost::json::parse(static_cast<std::string_view>(buf));
        } catch (const std::exception &ex) {
            throw error("failed to parse a JSON document", ex);
        }
    }

    value load(const std::string &path)
    {
        try {
            return parse(file::read(path));
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load JSON from {}", path), ex);
        }
    }

    void save_pretty(std::ostream& os, value const &jv, std::string *indent)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if (!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case kind::string:
                os << serialize(jv.get_string());
                break;
            case kind::uint64:
                os << jv.get_uint64();
                break;
            case kind::int64:
                os << jv.get_int64();
                break;
            case kind::double_:
                os << jv.get_double();
                break;
            case kind::bool_:
                os << (jv.get_bool() ? "true" : "false");
                break;
            case kind::null:
                os << "null";
                break;
        }
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}
