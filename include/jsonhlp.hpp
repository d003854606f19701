// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/writer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"

#include <string>
#include <vector>
#include <fstream>
#include <type_traits>
#include "lib.hpp"

using jdoc = rapidjson::Document;
using jval = rapidjson::Value;
using jdaloc = rapidjson::Document::AllocatorType;


// A namespace to keep our helper functions organized
namespace jhlp {

    // Parses a JSON string into a RapidJSON Document; logs and returns false on failure.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            LOG_WARN("JSON Parse Error: %s at offset %zu",
                     rapidjson::GetParseError_En(document.GetParseError()),
                     document.GetErrorOffset());
            return false;
        }
        return true;
    }

    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            LOG_WARN("Failed to open file: %s", file_path.c_str());
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            LOG_WARN("JSON Parse Error in file %s: %s at offset %zu", file_path.c_str(),
                     rapidjson::GetParseError_En(document.GetParseError()),
                     document.GetErrorOffset());
            return false;
        }
        return true;
    }

    // Serializes a Value (or Document) into a std::string.
    inline std::string stringify(const rapidjson::Value& value, bool pretty = false) {
        rapidjson::StringBuffer buffer;
        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            value.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            value.Accept(writer);
        }
        return buffer.GetString();
    }

    // Reads a member with a type check; returns default_value when missing or mistyped.
    template<typename T>
    inline T get(const rapidjson::Value& parent, const std::string& key, const T& default_value = T()) {
        if (!parent.IsObject() || !parent.HasMember(key.c_str())) { return default_value; }
        const jval& val = parent.FindMember(key.c_str())->value;
        if constexpr (std::is_same_v<T, std::string>) {
            if (val.IsString()) return val.GetString();
        } else if constexpr (std::is_same_v<T, int>) {
            if (val.IsInt()) return val.GetInt();
        } else if constexpr (std::is_same_v<T, bool>) {
            if (val.IsBool()) return val.GetBool();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val.IsUint64()) return val.GetUint64();
        }
        return default_value;
    }

    inline jval str_val(const std::string& s, jdaloc& allocator) {
        return jval(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
    }

    // Adds key:value to an object; strings are copied into the allocator.
    template<typename T>
    inline void set(rapidjson::Value& parent, const std::string& key, const T& value, jdaloc& allocator) {
        if constexpr (std::is_same_v<T, std::string>) {
            parent.AddMember(str_val(key, allocator), str_val(value, allocator), allocator);
        } else if constexpr (std::is_same_v<T, jval>) {
            jval copy(value, allocator);
            parent.AddMember(str_val(key, allocator), copy, allocator);
        } else {
            parent.AddMember(str_val(key, allocator), jval(value), allocator);
        }
    }

    inline jval str_array(const std::vector<std::string>& items, jdaloc& allocator) {
        jval arr(rapidjson::kArrayType);
        for (const auto& s : items) {
            arr.PushBack(str_val(s, allocator), allocator);
        }
        return arr;
    }

} // namespace jhlp
