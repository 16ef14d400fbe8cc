#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace swiftdrop::metadata {

// Flat JSON objects whose values are all strings. Shared by the rendezvous
// code and the metadata frame.
using Fields = std::vector<std::pair<std::string, std::string>>;
using MetadataMap = std::unordered_map<std::string, std::string>;

std::string Build(const Fields& fields);

// Throws FormatError on anything but a flat object of string values.
MetadataMap Parse(std::string_view json);

std::string GetValue(const MetadataMap& meta, std::string_view key);
bool Has(const MetadataMap& meta, std::string_view key);

}  // namespace swiftdrop::metadata
