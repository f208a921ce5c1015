#pragma once

#include <stdint.h>
#include <string>

#include "rapidjson/document.h"
#include "ipgeo/Record.hpp"

namespace ipgeo {
namespace json {

// Adds {"ip": ip, "<field>": value, ...} for the fields selected by mask.
// Strings stay strings, latitude/longitude/elevation become numbers.
void PopulateJsonDoc(rapidjson::Document *doc, const std::string &ip,
                     const Record &record, uint32_t mask);

// Compact JSON text of the document PopulateJsonDoc builds.
std::string ToJsonString(const std::string &ip, const Record &record,
                         uint32_t mask);

} // namespace json
} // namespace ipgeo
