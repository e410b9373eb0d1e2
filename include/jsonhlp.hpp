// jsonhlp.hpp

#pragma once

// Centralize all necessary RapidJSON headers
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/istreamwrapper.h"

#include <iostream>
#include <string>
#include <fstream>

namespace json = rapidjson;
using jdoc = json::Document;
using jval = json::Value;


// A namespace to keep our helper functions organized
namespace jhlp {


    // Parses a JSON string into a RapidJSON Document.
    // Returns true on success and prints an error message on failure.
    inline bool parse_str(const std::string& json_string, rapidjson::Document& document) {
        document.Parse(json_string.c_str());
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error: " << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    // Parses a JSON file into a RapidJSON Document.
    inline bool parse_file(const std::string& file_path, rapidjson::Document& document) {
        std::ifstream ifs(file_path);
        if (!ifs.is_open()) {
            std::cerr << "Failed to open file: " << file_path << std::endl;
            return false;
        }
        rapidjson::IStreamWrapper isw(ifs);
        document.ParseStream(isw);
        if (document.HasParseError()) {
            std::cerr << "JSON Parse Error in file " << file_path << ": "
                      << rapidjson::GetParseError_En(document.GetParseError())
                      << " at offset " << document.GetErrorOffset() << std::endl;
            return false;
        }
        return true;
    }

    inline std::string stringify(const rapidjson::Value& value) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
        return buffer.GetString();
    }

    inline bool has(const rapidjson::Value& parent, const std::string& key) {
        return parent.IsObject() && parent.HasMember(key.c_str());
    }

} // namespace jhlp
