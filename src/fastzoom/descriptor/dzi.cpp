// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fastzoom/descriptor/dzi.h"

#include <pugixml.hpp>

#include <sstream>
#include <string>

#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom::descriptor {

namespace {

absl::StatusOr<uint32_t> GetUintAttribute(const pugi::xml_node& node,
                                          const char* name) {
  const pugi::xml_attribute attribute = node.attribute(name);
  if (attribute.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("<%s> is missing attribute %s",
                                       node.name(), name));
  }
  uint32_t value = 0;
  if (!absl::SimpleAtoi(attribute.value(), &value)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("<%s> attribute %s=\"%s\" is not a "
                                       "non-negative integer",
                                       node.name(), name, attribute.value()));
  }
  return value;
}

}  // namespace

DziDescriptor MakeDescriptor(const core::PyramidPlan& plan,
                             std::string_view format) {
  DziDescriptor descriptor;
  descriptor.tile_size = plan.GetTileSize();
  descriptor.overlap = plan.GetOverlap();
  descriptor.format = std::string(format);
  descriptor.size = plan.GetFullDimensions();
  return descriptor;
}

absl::StatusOr<std::string> WriteDzi(const DziDescriptor& descriptor) {
  if (descriptor.format.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Descriptor format token must not be empty");
  }

  pugi::xml_document doc;
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  declaration.append_attribute("version") = "1.0";
  declaration.append_attribute("encoding") = "UTF-8";

  pugi::xml_node image = doc.append_child("Image");
  image.append_attribute("TileSize") = descriptor.tile_size;
  image.append_attribute("Overlap") = descriptor.overlap;
  image.append_attribute("Format") = descriptor.format.c_str();
  image.append_attribute("xmlns") = std::string(kDeepZoomNamespace).c_str();

  pugi::xml_node size = image.append_child("Size");
  size.append_attribute("Width") = descriptor.size[0];
  size.append_attribute("Height") = descriptor.size[1];

  std::ostringstream out;
  doc.save(out, "", pugi::format_raw, pugi::encoding_utf8);
  return out.str();
}

absl::StatusOr<DziDescriptor> ParseDzi(std::string_view xml) {
  pugi::xml_document doc;
  const pugi::xml_parse_result result =
      doc.load_buffer(xml.data(), xml.size());
  if (!result) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Failed to parse descriptor: %s",
                                       result.description()));
  }

  const pugi::xml_node image = doc.child("Image");
  if (image.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Invalid descriptor - missing Image element");
  }
  if (kDeepZoomNamespace != image.attribute("xmlns").value()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Unexpected descriptor namespace \"%s\"",
                        image.attribute("xmlns").value()));
  }

  DziDescriptor descriptor;
  ASSIGN_OR_RETURN(descriptor.tile_size, GetUintAttribute(image, "TileSize"));
  ASSIGN_OR_RETURN(descriptor.overlap, GetUintAttribute(image, "Overlap"));
  descriptor.format = image.attribute("Format").value();
  if (descriptor.format.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Descriptor is missing the Format attribute");
  }

  const pugi::xml_node size = image.child("Size");
  if (size.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Invalid descriptor - missing Size element");
  }
  ASSIGN_OR_RETURN(descriptor.size[0], GetUintAttribute(size, "Width"));
  ASSIGN_OR_RETURN(descriptor.size[1], GetUintAttribute(size, "Height"));
  return descriptor;
}

}  // namespace fastzoom::descriptor
